#pragma once
#include <cmath>
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "domain/document_json.h"
#include "http/request_fields.h"
#include "http/responses.h"
#include "../security/session_guard.h"

inline void registerOrderRoutes(crow::SimpleApp& app, AppContext& ctx) {
    // Заявка на оплату: создаёт или обновляет неоплаченный заказ пользователя
    CROW_ROUTE(app, "/api/payment/crypto").methods("POST"_method)
    ([&ctx](const crow::request& req) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            auto body = parseBody(req);

            QuoteRequest q;
            if (!body.contains("profile_id") || !body.contains("amount")) {
                throw ValidationError("Invalid payment data");
            }
            q.profile_id = idFrom(body["profile_id"]);
            q.telegram_user_id = user->telegram_id;
            q.amount = amountFrom(body["amount"]);
            q.crypto_type = body.value("wallet", std::string());
            q.currency = body.value("currency", std::string("USD"));
            if (q.profile_id <= 0) throw ValidationError("Invalid payment data");

            std::string wallet_address;
            Order order = ctx.store.update([&](Document& doc) {
                auto it = doc.settings.crypto_wallets.find(q.crypto_type);
                wallet_address = it == doc.settings.crypto_wallets.end() ? "" : it->second;
                return ctx.ledger.quote(doc, q, nowUtc());
            });

            return jsonResponse({
                {"status", "success"},
                {"order_id", order.id},
                {"order_number", order.order_number},
                {"amount", order.amount},
                {"bonus_amount", order.bonus_amount},
                {"total_amount", order.total_amount},
                {"wallet_address", wallet_address},
                {"expires_in", std::chrono::duration_cast<std::chrono::seconds>(OrderLedger::kPaymentWindow).count()},
            });
        });
    });

    CROW_ROUTE(app, "/api/user/orders").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            OrderFilter filter = parseOrderFilter(queryParam(req, "status").value_or("all"));
            Document doc = ctx.store.load();

            nlohmann::json orders = nlohmann::json::array();
            for (const auto& order : ctx.ledger.ordersOf(doc, user->telegram_id, filter)) {
                auto profile = ctx.catalog.find(doc, order.profile_id);
                if (!profile) continue;

                nlohmann::json item = order;
                item["profile_name"] = profile->name;
                item["profile_photo"] = profile->photos.empty() ? nlohmann::json() : nlohmann::json(profile->photos.front());
                item["profile_city"] = profile->city;
                orders.push_back(std::move(item));
            }
            return jsonResponse({{"orders", orders}});
        });
    });

    // Пользователь удаляет свой заказ
    CROW_ROUTE(app, "/api/orders/<int>").methods("DELETE"_method)
    ([&ctx](const crow::request& req, int orderId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            bool removed = ctx.store.tryUpdate([&](Document& doc) {
                return ctx.ledger.remove(doc, orderId, user->telegram_id);
            });
            if (!removed) return errorResponse(404, "Order not found or unauthorized");
            return jsonResponse({{"status", "deleted"}, {"order_id", orderId}});
        });
    });
}
