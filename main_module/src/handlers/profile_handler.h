#pragma once
#include <algorithm>
#include <random>
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "domain/document_json.h"
#include "http/responses.h"
#include "../security/session_guard.h"

inline int intParam(const crow::request& req, const char* name, int def) {
    auto v = queryParam(req, name);
    if (!v) return def;
    return static_cast<int>(to_ll(*v, def));
}

inline void registerProfileRoutes(crow::SimpleApp& app, AppContext& ctx) {
    // Каталог с фильтрами и пагинацией
    CROW_ROUTE(app, "/api/profiles").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        return guarded("public", [&] {
            ProfileFilter f;
            f.city = queryParam(req, "city").value_or("");
            f.nationality = queryParam(req, "nationality").value_or("");
            f.travel_city = queryParam(req, "travel_city").value_or("");
            f.gender = queryParam(req, "gender").value_or("");
            f.age_min = intParam(req, "age_min", 0);
            f.age_max = intParam(req, "age_max", 0);
            f.height_min = intParam(req, "height_min", 0);
            f.height_max = intParam(req, "height_max", 0);
            f.weight_min = intParam(req, "weight_min", 0);
            f.weight_max = intParam(req, "weight_max", 0);
            f.chest_min = intParam(req, "chest_min", 0);
            f.chest_max = intParam(req, "chest_max", 0);
            f.page = intParam(req, "page", 0);
            f.limit = intParam(req, "limit", 12);

            auto page = ctx.catalog.search(ctx.store.load(), f);
            return jsonResponse({
                {"profiles", page.profiles},
                {"has_more", page.has_more},
                {"total", page.total},
            });
        });
    });

    // Значения для фильтров каталога
    CROW_ROUTE(app, "/api/filters/cities").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse({{"cities", ctx.catalog.facets(ctx.store.load()).cities}});
        });
    });

    CROW_ROUTE(app, "/api/filters/nationalities").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse({{"nationalities", ctx.catalog.facets(ctx.store.load()).nationalities}});
        });
    });

    CROW_ROUTE(app, "/api/filters/travel_cities").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse({{"travel_cities", ctx.catalog.facets(ctx.store.load()).travel_cities}});
        });
    });

    CROW_ROUTE(app, "/api/filters/genders").methods("GET"_method)
    ([] {
        return jsonResponse({{"genders", ProfileCatalog::genders()}});
    });

    // VIP превью отдаются в случайном порядке
    CROW_ROUTE(app, "/api/vip-profiles").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            auto profiles = ctx.catalog.vipProfiles(ctx.store.load());
            std::mt19937 rng(std::random_device{}());
            std::shuffle(profiles.begin(), profiles.end(), rng);
            return jsonResponse({{"profiles", profiles}});
        });
    });

    CROW_ROUTE(app, "/api/vip-catalogs").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse(ctx.catalog.vipCatalogs(ctx.store.load()));
        });
    });

    CROW_ROUTE(app, "/api/profiles/<int>").methods("GET"_method)
    ([&ctx](const crow::request&, int profileId) {
        return guarded("public", [&] {
            Document doc = ctx.store.load();
            auto profile = ctx.catalog.find(doc, profileId);
            if (!profile || !profile->visible) return errorResponse(404, "Profile not found");

            nlohmann::json body = *profile;
            body["comments"] = ctx.catalog.commentsOf(doc, profileId);
            return jsonResponse(body);
        });
    });

    CROW_ROUTE(app, "/api/profiles/<int>/comments").methods("GET"_method)
    ([&ctx](const crow::request&, int profileId) {
        return guarded("public", [&] {
            return jsonResponse({{"comments", ctx.catalog.commentsOf(ctx.store.load(), profileId)}});
        });
    });

    // Отзыв можно оставить только после подтверждённой оплаты в своём чате с анкетой
    CROW_ROUTE(app, "/api/profiles/<int>/comments").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            auto body = parseBody(req);
            std::string text = body.value("text", std::string());

            CommentAuthor author{user->telegram_id, user->username, user->first_name};
            Comment comment = ctx.store.update([&](Document& doc) {
                return ctx.catalog.addUserComment(doc, profileId, author, text, nowUtc());
            });
            return jsonResponse({{"status", "added"}, {"comment", comment}});
        });
    });
}
