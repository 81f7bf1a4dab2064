#pragma once
#include <cmath>
#include "crow.h"
#include "app_context.h"
#include "domain/document_json.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline void registerAdminSettingsRoutes(crow::SimpleApp& app, AppContext& ctx) {
    CROW_ROUTE(app, "/api/admin/crypto_wallets").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            return jsonResponse(nlohmann::json(ctx.store.load().settings.crypto_wallets));
        });
    });

    // Пустой адрес удаляет кошелёк
    CROW_ROUTE(app, "/api/admin/crypto_wallets").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            std::map<std::string, std::string> wallets;
            for (auto it = body.begin(); it != body.end(); ++it) {
                if (!it.value().is_string()) throw ValidationError("Wallet address must be a string");
                std::string address = it.value().get<std::string>();
                if (!address.empty()) wallets[it.key()] = address;
            }

            ctx.store.update([&](Document& doc) {
                doc.settings.crypto_wallets = wallets;
            });
            CROW_LOG_INFO << "[admin] crypto wallets updated, " << wallets.size() << " configured";
            return jsonResponse({{"status", "updated"}, {"wallets", wallets}});
        });
    });

    CROW_ROUTE(app, "/api/admin/banner").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            return jsonResponse(nlohmann::json(ctx.store.load().settings.banner));
        });
    });

    CROW_ROUTE(app, "/api/admin/banner").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Banner banner = parseBody(req).get<Banner>();
            ctx.store.update([&](Document& doc) {
                doc.settings.banner = banner;
            });
            return jsonResponse({{"status", "updated"}, {"banner", banner}});
        });
    });

    CROW_ROUTE(app, "/api/admin/vip-catalogs").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            return jsonResponse(ctx.catalog.vipCatalogs(ctx.store.load()));
        });
    });

    // Каталоги заменяются целиком
    CROW_ROUTE(app, "/api/admin/vip-catalogs").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto catalogs = parseBody(req);
            ctx.store.update([&](Document& doc) {
                ctx.catalog.setVipCatalogs(doc, catalogs);
            });
            return jsonResponse({{"status", "updated"}});
        });
    });

    CROW_ROUTE(app, "/api/admin/bonus").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            if (!body.contains("bonus_percentage") || !body["bonus_percentage"].is_number()) {
                throw ValidationError("bonus_percentage must be a number");
            }
            const double pct = body["bonus_percentage"].get<double>();
            if (!std::isfinite(pct) || pct < 0 || pct > 100) {
                throw ValidationError("bonus_percentage must be between 0 and 100");
            }

            ctx.store.update([&](Document& doc) {
                doc.settings.bonus_percentage = pct;
            });
            CROW_LOG_INFO << "[admin] bonus percentage set to " << pct;
            return jsonResponse({{"status", "updated"}, {"bonus_percentage", pct}});
        });
    });
}
