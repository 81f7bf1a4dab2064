#pragma once
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "domain/document_json.h"
#include "http/message_body.h"
#include "http/responses.h"
#include "../security/session_guard.h"

inline void registerChatRoutes(crow::SimpleApp& app, AppContext& ctx) {
    // Сообщение пользователя в чат с анкетой; чат создаётся при первом сообщении
    CROW_ROUTE(app, "/api/chats/<int>/messages").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            MessageDraft draft = messageDraftFrom(parseBody(req), Sender::User);
            const Timestamp now = nowUtc();

            AppendResult result = ctx.store.update([&](Document& doc) {
                Chat chat = ctx.chats.findOrCreate(doc, profileId, user->telegram_id, now);
                return ctx.chats.appendMessage(doc, chat.id, draft, now);
            });
            CROW_LOG_INFO << "[public] user " << user->telegram_id << " wrote to profile " << profileId
                          << ", message #" << result.message.id;

            return jsonResponse({{"status", "sent"}, {"message_id", result.message.id}});
        });
    });

    CROW_ROUTE(app, "/api/chats/<int>/messages").methods("GET"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            Document doc = ctx.store.load();
            auto chat = ctx.chats.find(doc, profileId, user->telegram_id);
            if (!chat) return jsonResponse({{"messages", nlohmann::json::array()}, {"last_message_id", 0}});

            auto messages = ctx.chats.messagesOf(doc, chat->id);
            long long last_id = messages.empty() ? 0 : messages.back().id;
            return jsonResponse({{"messages", messages}, {"last_message_id", last_id}});
        });
    });

    // Опрос новых сообщений после last_message_id
    CROW_ROUTE(app, "/api/chats/<int>/updates").methods("GET"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            long long after = to_ll(queryParam(req, "last_message_id").value_or("0"), 0);

            Document doc = ctx.store.load();
            auto chat = ctx.chats.find(doc, profileId, user->telegram_id);
            if (!chat) return jsonResponse({{"messages", nlohmann::json::array()}, {"last_message_id", 0}});

            auto all = ctx.chats.messagesOf(doc, chat->id);
            long long last_id = all.empty() ? 0 : all.back().id;
            return jsonResponse({{"messages", ctx.chats.messagesOf(doc, chat->id, after)},
                                 {"last_message_id", last_id}});
        });
    });

    CROW_ROUTE(app, "/api/user/chats").methods("GET"_method)
    ([&ctx](const crow::request& req) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            nlohmann::json chats = nlohmann::json::array();
            for (const auto& s : ctx.chats.summaries(ctx.store.load(), user->telegram_id)) {
                chats.push_back({
                    {"chat_id", s.chat_id},
                    {"profile_id", s.profile_id},
                    {"profile_name", s.profile_name},
                    {"profile_photo", s.profile_photo ? nlohmann::json(*s.profile_photo) : nlohmann::json()},
                    {"last_message", s.last_message},
                    {"last_message_time", formatTimestamp(s.last_message_time)},
                    {"unread_count", s.unread_count},
                });
            }
            return jsonResponse({{"chats", chats}});
        });
    });

    CROW_ROUTE(app, "/api/chats/<int>/mark_read").methods("POST"_method)
    ([&ctx](const crow::request& req, int profileId) {
        auto user = telegramUser(req, ctx.sessions);
        if (!user) return errorResponse(401, "Not authenticated");

        return guarded("public", [&] {
            bool found = false;
            ctx.store.tryUpdate([&](Document& doc) {
                auto chat = ctx.chats.find(doc, profileId, user->telegram_id);
                found = chat.has_value();
                return found && ctx.chats.markReadByUser(doc, chat->id);
            });
            if (!found) return jsonResponse({{"status", "chat_not_found"}});
            return jsonResponse({{"status", "marked_read"}});
        });
    });
}
