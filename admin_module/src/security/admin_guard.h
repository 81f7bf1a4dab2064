#pragma once
#include <optional>
#include <string>
#include "crow.h"
#include "http/responses.h"
#include "security/session_registry.h"

// Сессия админки: cookie session_id, логин/пароль из окружения

inline const char* const kAdminSessionCookie = "session_id";

struct AdminCredentials {
    std::string username;
    std::string password;
};

inline std::optional<std::string> adminUser(
    const crow::request& req,
    const SessionRegistry& sessions
) {
    auto identity = sessions.find(cookieValue(req, kAdminSessionCookie));
    if (!identity || identity->username.empty()) {
        return std::nullopt;
    }
    return identity->username;
}
