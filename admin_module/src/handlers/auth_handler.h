#pragma once
#include "crow.h"
#include "app_context.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline void registerAdminAuthRoutes(crow::SimpleApp& app, AppContext& ctx, const AdminCredentials& creds) {
    CROW_ROUTE(app, "/api/login").methods("POST"_method)
    ([&ctx, creds](const crow::request& req) {
        return guarded("admin", [&] {
            auto body = parseBody(req);
            const std::string username = body.value("username", std::string());
            const std::string password = body.value("password", std::string());

            if (username != creds.username || password != creds.password) {
                CROW_LOG_WARNING << "[admin] failed login for '" << username << "' from " << req.remote_ip_address;
                return errorResponse(401, "Invalid credentials");
            }

            SessionIdentity identity;
            identity.username = username;
            std::string session_id = ctx.sessions.create(identity);
            CROW_LOG_INFO << "[admin] " << username << " logged in";

            auto res = jsonResponse({{"status", "success"}});
            setSessionCookie(res, kAdminSessionCookie, session_id);
            return res;
        });
    });

    CROW_ROUTE(app, "/api/logout").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");

        ctx.sessions.destroy(cookieValue(req, kAdminSessionCookie));
        auto res = jsonResponse({{"status", "logged_out"}});
        clearSessionCookie(res, kAdminSessionCookie);
        return res;
    });
}
