#pragma once
#include <algorithm>
#include "crow.h"
#include "app_context.h"
#include "domain/document_json.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline void registerAdminBookingRoutes(crow::SimpleApp& app, AppContext& ctx) {
    // Сначала неоплаченные, внутри группы новые выше
    CROW_ROUTE(app, "/api/admin/bookings").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Document doc = ctx.store.load();
            std::vector<Order> orders = doc.orders;
            std::stable_sort(orders.begin(), orders.end(), [](const Order& a, const Order& b) {
                if (a.status != b.status) return a.status == OrderStatus::Unpaid;
                return a.created_at > b.created_at;
            });

            nlohmann::json out = nlohmann::json::array();
            for (const auto& order : orders) {
                nlohmann::json item = order;
                auto profile = ctx.catalog.find(doc, order.profile_id);
                item["profile_name"] = profile ? nlohmann::json(profile->name) : nlohmann::json();
                item["profile_city"] = profile ? nlohmann::json(profile->city) : nlohmann::json();
                out.push_back(std::move(item));
            }
            return jsonResponse({{"bookings", out}});
        });
    });

    // Ручное подтверждение: заказ становится booked, пользователь получает системное сообщение
    CROW_ROUTE(app, "/api/admin/bookings/<int>/confirm").methods("POST"_method)
    ([&ctx](const crow::request& req, int orderId) {
        auto admin = adminUser(req, ctx.sessions);
        if (!admin) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            const Timestamp now = nowUtc();
            auto order = ctx.store.update([&](Document& doc) {
                return ctx.chats.confirmOrder(doc, orderId, now);
            });
            if (!order) return errorResponse(404, "Order not found");

            CROW_LOG_INFO << "[admin] " << *admin << " confirmed order " << order->order_number;
            return jsonResponse({{"status", "confirmed"}, {"order", *order}});
        });
    });
}
