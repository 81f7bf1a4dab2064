#pragma once
#include <optional>
#include <string>
#include "crow.h"
#include "http/responses.h"
#include "security/session_registry.h"

// Сессия пользователя Mini App: cookie telegram_session

inline const char* const kTelegramSessionCookie = "telegram_session";

inline std::optional<SessionIdentity> telegramUser(
    const crow::request& req,
    const SessionRegistry& sessions
) {
    auto user = sessions.find(cookieValue(req, kTelegramSessionCookie));
    if (!user || user->telegram_id.empty()) {
        return std::nullopt;
    }
    return user;
}
