#pragma once
#include "crow.h"
#include "app_context.h"
#include "domain/document_json.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline void registerAdminCommentRoutes(crow::SimpleApp& app, AppContext& ctx) {
    CROW_ROUTE(app, "/api/admin/comments").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Document doc = ctx.store.load();
            nlohmann::json out = nlohmann::json::array();
            for (auto it = doc.comments.rbegin(); it != doc.comments.rend(); ++it) {
                nlohmann::json item = *it;
                auto profile = ctx.catalog.find(doc, it->profile_id);
                item["profile_name"] = profile ? nlohmann::json(profile->name) : nlohmann::json();
                out.push_back(std::move(item));
            }
            return jsonResponse({{"comments", out}});
        });
    });

    // Отзыв от имени админа: без проверки сделки
    CROW_ROUTE(app, "/api/admin/comments/add").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            if (!body.contains("profile_id") || !body["profile_id"].is_number_integer()) {
                throw ValidationError("profile_id is required");
            }
            const long long profileId = body["profile_id"].get<long long>();
            const std::string author = body.value("user_name", std::string());
            const std::string text = body.value("text", std::string());

            Comment comment = ctx.store.update([&](Document& doc) {
                return ctx.catalog.addAdminComment(doc, profileId, author, text, nowUtc());
            });
            return jsonResponse({{"status", "created"}, {"comment", comment}});
        });
    });

    CROW_ROUTE(app, "/api/admin/comments/<int>/<int>").methods("DELETE"_method)
    ([&ctx](const crow::request& req, int profileId, int commentId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            bool removed = ctx.store.tryUpdate([&](Document& doc) {
                return ctx.catalog.removeComment(doc, profileId, commentId);
            });
            if (!removed) return errorResponse(404, "Comment not found");
            return jsonResponse({{"status", "deleted"}});
        });
    });
}
