#pragma once
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "domain/document_json.h"
#include "http/request_fields.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline void registerAdminProfileRoutes(crow::SimpleApp& app, AppContext& ctx) {
    CROW_ROUTE(app, "/api/admin/profiles").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            return jsonResponse({{"profiles", ctx.store.load().profiles}});
        });
    });

    // Фото передаются ссылками на уже загруженные файлы
    CROW_ROUTE(app, "/api/admin/profiles").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);

            ProfileDraft draft;
            draft.name = body.value("name", std::string());
            draft.age = intField(body, "age");
            draft.gender = body.value("gender", std::string());
            draft.nationality = body.value("nationality", std::string());
            draft.city = body.value("city", std::string());
            draft.travel_cities = stringList(body, "travel_cities");
            draft.description = body.value("description", std::string());
            draft.photos = stringList(body, "photos");
            draft.height = intField(body, "height");
            draft.weight = intField(body, "weight");
            draft.chest = intField(body, "chest");

            Profile profile = ctx.store.update([&](Document& doc) {
                return ctx.catalog.create(doc, draft, nowUtc());
            });
            return jsonResponse({{"status", "created"}, {"profile", profile}});
        });
    });

    CROW_ROUTE(app, "/api/admin/profiles/<int>/toggle").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            if (!body.contains("visible") || !body["visible"].is_boolean()) {
                throw ValidationError("visible must be a boolean");
            }
            const bool visible = body["visible"].get<bool>();

            bool found = ctx.store.tryUpdate([&](Document& doc) {
                return ctx.catalog.setVisible(doc, profileId, visible);
            });
            if (!found) return errorResponse(404, "Profile not found");
            return jsonResponse({{"status", "updated"}});
        });
    });

    // Вместе с анкетой удаляются её чаты, сообщения и отзывы
    CROW_ROUTE(app, "/api/admin/profiles/<int>").methods("DELETE"_method)
    ([&ctx](const crow::request& req, int profileId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            bool found = ctx.store.tryUpdate([&](Document& doc) {
                return ctx.catalog.remove(doc, profileId);
            });
            if (!found) return errorResponse(404, "Profile not found");
            return jsonResponse({{"status", "deleted"}});
        });
    });

    CROW_ROUTE(app, "/api/admin/vip-profiles").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            return jsonResponse({{"profiles", ctx.catalog.vipProfiles(ctx.store.load())}});
        });
    });

    CROW_ROUTE(app, "/api/admin/vip-profiles").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);

            VipProfileDraft draft;
            draft.name = body.value("name", std::string());
            draft.age = intField(body, "age");
            draft.city = body.value("city", std::string());
            draft.gender = body.value("gender", std::string("female"));
            draft.photos = stringList(body, "photos");

            VipProfile profile = ctx.store.update([&](Document& doc) {
                return ctx.catalog.addVipProfile(doc, draft, nowUtc());
            });
            return jsonResponse({{"status", "created"}, {"profile", profile}});
        });
    });

    CROW_ROUTE(app, "/api/admin/vip-profiles/<int>").methods("DELETE"_method)
    ([&ctx](const crow::request& req, int vipId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            bool found = ctx.store.tryUpdate([&](Document& doc) {
                return ctx.catalog.removeVipProfile(doc, vipId);
            });
            if (!found) return errorResponse(404, "VIP profile not found");
            return jsonResponse({{"status", "deleted"}});
        });
    });

    CROW_ROUTE(app, "/api/stats").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Document doc = ctx.store.load();
            CatalogStats s = ctx.catalog.stats(doc);
            return jsonResponse({
                {"profiles_count", s.profiles},
                {"vip_profiles_count", s.vip_profiles},
                {"chats_count", s.chats},
                {"messages_count", s.messages},
                {"comments_count", s.comments},
                {"promocodes_count", s.promocodes},
                {"unread_messages_count", s.unread_messages},
            });
        });
    });
}
