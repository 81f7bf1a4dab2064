#pragma once
#include "crow.h"
#include "app_context.h"
#include "http/responses.h"
#include "../security/session_guard.h"

// id из Telegram приходит числом, в документе хранится строкой
inline std::string telegramIdOf(const nlohmann::json& v) {
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_string()) return v.get<std::string>();
    return "";
}

inline void registerAuthRoutes(crow::SimpleApp& app, AppContext& ctx) {
    // Вход из Mini App. Подпись initData здесь не проверяется
    CROW_ROUTE(app, "/api/telegram/auth").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        return guarded("public", [&] {
            auto body = parseBody(req);
            const nlohmann::json& user = body.contains("user") ? body["user"] : body;
            if (!user.is_object() || !user.contains("id")) {
                throw ValidationError("user id is required");
            }

            SessionIdentity identity;
            identity.telegram_id = telegramIdOf(user["id"]);
            if (identity.telegram_id.empty()) throw ValidationError("user id is required");
            identity.username = user.value("username", std::string());
            identity.first_name = user.value("first_name", std::string());

            std::string session_id = ctx.sessions.create(identity);
            CROW_LOG_INFO << "[public] telegram user " << identity.telegram_id << " signed in";

            auto res = jsonResponse({
                {"status", "success"},
                {"user", {
                    {"telegram_id", identity.telegram_id},
                    {"username", identity.username},
                    {"first_name", identity.first_name},
                }},
            });
            setSessionCookie(res, kTelegramSessionCookie, session_id);
            return res;
        });
    });

    CROW_ROUTE(app, "/api/telegram/me").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return jsonResponse({
            {"telegram_id", user->telegram_id},
            {"username", user->username},
            {"first_name", user->first_name},
        });
    });

    CROW_ROUTE(app, "/api/telegram/logout").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        ctx.sessions.destroy(cookieValue(req, kTelegramSessionCookie));
        auto res = jsonResponse({{"status", "logged_out"}});
        clearSessionCookie(res, kTelegramSessionCookie);
        return res;
    });
}
