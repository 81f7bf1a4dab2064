#pragma once
#include <algorithm>
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "domain/document_json.h"
#include "http/message_body.h"
#include "http/request_fields.h"
#include "http/responses.h"
#include "../security/admin_guard.h"

inline ChatSelector chatSelectorFrom(const crow::request& req, const nlohmann::json& body) {
    return chatSelectorFrom(queryParam(req, "chat_id"), queryParam(req, "telegram_user_id"), body);
}

inline void registerAdminChatRoutes(crow::SimpleApp& app, AppContext& ctx) {
    CROW_ROUTE(app, "/api/admin/chats").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Document doc = ctx.store.load();

            struct Row {
                nlohmann::json json;
                Timestamp activity;
            };
            std::vector<Row> rows;
            for (const auto& chat : doc.chats) {
                auto messages = ctx.chats.messagesOf(doc, chat.id);
                Row row;
                row.activity = messages.empty() ? chat.created_at : messages.back().created_at;
                row.json = chat;
                row.json["message_count"] = messages.size();
                row.json["unread_count"] = ctx.chats.unreadCount(doc, chat.id);
                row.json["last_message"] = messages.empty() ? nlohmann::json() : nlohmann::json(messages.back());
                rows.push_back(std::move(row));
            }
            std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
                return a.activity > b.activity;
            });

            nlohmann::json out = nlohmann::json::array();
            for (auto& row : rows) out.push_back(std::move(row.json));
            return jsonResponse({{"chats", out}});
        });
    });

    CROW_ROUTE(app, "/api/admin/chats/<int>/messages").methods("GET"_method)
    ([&ctx](const crow::request& req, int profileId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            Document doc = ctx.store.load();
            auto chat = selectChat(doc, ctx.chats, profileId, chatSelectorFrom(req, nlohmann::json::object()));
            if (!chat) return jsonResponse({{"chat", nullptr}, {"messages", nlohmann::json::array()}});

            return jsonResponse({{"chat", *chat}, {"messages", ctx.chats.messagesOf(doc, chat->id)}});
        });
    });

    // Ответ от имени анкеты. "payment successful" в тексте бронирует заказ пользователя этого чата
    CROW_ROUTE(app, "/api/admin/chats/<int>/reply").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto admin = adminUser(req, ctx.sessions);
        if (!admin) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            ChatSelector sel = chatSelectorFrom(req, body);
            MessageDraft draft = messageDraftFrom(body, Sender::Admin);
            const Timestamp now = nowUtc();

            AppendResult result = ctx.store.update([&](Document& doc) {
                Chat chat = selectOrCreateChat(doc, ctx.chats, profileId, sel, now);
                return ctx.chats.appendMessage(doc, chat.id, draft, now);
            });
            CROW_LOG_INFO << "[admin] " << *admin << " replied in chat " << result.message.chat_id
                          << ", message #" << result.message.id;

            nlohmann::json out = {{"status", "sent"}, {"message_id", result.message.id}};
            out["booked_order"] = result.booked ? nlohmann::json(*result.booked) : nlohmann::json();
            return jsonResponse(out);
        });
    });

    CROW_ROUTE(app, "/api/admin/chats/<int>/system-message").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            auto body = parseBody(req);
            ChatSelector sel = chatSelectorFrom(req, body);
            const std::string text = body.value("text", std::string());
            if (text.empty()) throw ValidationError("Message text is required");
            const Timestamp now = nowUtc();

            ChatMessage message = ctx.store.update([&](Document& doc) {
                Chat chat = selectOrCreateChat(doc, ctx.chats, profileId, sel, now);
                return ctx.chats.appendSystemMessage(doc, chat.id, text, now);
            });
            return jsonResponse({{"status", "sent"}, {"message_id", message.id}});
        });
    });

    // Здесь id чата, не анкеты
    CROW_ROUTE(app, "/api/admin/chats/<int>/mark-read").methods("POST"_method)
    ([&ctx](const crow::request& req, int chatId) {
        if (!adminUser(req, ctx.sessions)) return errorResponse(401, "Not authenticated");
        return guarded("admin", [&] {
            bool found = false;
            std::size_t marked = 0;
            ctx.store.tryUpdate([&](Document& doc) {
                found = ctx.chats.findById(doc, chatId).has_value();
                if (!found) return false;
                marked = ctx.chats.markRead(doc, chatId);
                return marked > 0;
            });
            if (!found) return errorResponse(404, "Chat not found");
            return jsonResponse({{"status", "marked_read"}, {"marked", marked}});
        });
    });
}
