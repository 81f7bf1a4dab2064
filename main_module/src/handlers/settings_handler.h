#pragma once
#include "crow.h"
#include "app_context.h"
#include "domain/document_json.h"
#include "http/responses.h"

// Публичные настройки витрины, без авторизации
inline void registerSettingsRoutes(crow::SimpleApp& app, AppContext& ctx) {
    CROW_ROUTE(app, "/api/settings/crypto_wallets").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse(nlohmann::json(ctx.store.load().settings.crypto_wallets));
        });
    });

    CROW_ROUTE(app, "/api/settings/banner").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            return jsonResponse(nlohmann::json(ctx.store.load().settings.banner));
        });
    });

    CROW_ROUTE(app, "/api/settings/app").methods("GET"_method)
    ([&ctx] {
        return guarded("public", [&] {
            const Settings settings = ctx.store.load().settings;
            nlohmann::json body = settings.app;
            body["bonus_percentage"] = settings.bonus_percentage;
            return jsonResponse(body);
        });
    });
}
