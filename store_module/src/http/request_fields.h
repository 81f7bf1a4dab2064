#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config/env.h"
#include "../db/store_errors.h"
#include "../domain/chat_registry.h"
#include "../domain/entities.h"

// Поля JSON-тел из формы админки и мини-приложения: числа приходят и числом, и строкой

// Сумма: 50, 50.5 или "50.5". "50abc" не принимается
inline double amountFrom(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        try {
            std::size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        } catch (const std::logic_error&) {
        }
    }
    throw ValidationError("Invalid payment data");
}

// Целый id числом или строкой. Всё остальное, включая 1.5, даёт 0
inline long long idFrom(const nlohmann::json& v) {
    if (v.is_number_integer()) return v.get<long long>();
    if (v.is_string()) return to_ll(v.get<std::string>(), 0);
    return 0;
}

inline int intField(const nlohmann::json& body, const char* key) {
    if (!body.contains(key)) return 0;
    const auto& v = body[key];
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_number()) return static_cast<int>(v.get<double>());
    if (v.is_string()) return static_cast<int>(to_ll(v.get<std::string>(), 0));
    throw ValidationError(std::string(key) + " must be a number");
}

// Массив строк или "Paris, Rome" из формы. Пустые элементы выбрасываются
inline std::vector<std::string> stringList(const nlohmann::json& body, const char* key) {
    std::vector<std::string> out;
    if (!body.contains(key)) return out;
    const auto& v = body[key];
    if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string() && !item.get<std::string>().empty()) out.push_back(item.get<std::string>());
        }
    } else if (v.is_string()) {
        std::string s = v.get<std::string>();
        std::size_t pos = 0;
        while (pos <= s.size()) {
            std::size_t end = s.find(',', pos);
            if (end == std::string::npos) end = s.size();
            std::string part = s.substr(pos, end - pos);
            auto b = part.find_first_not_of(' ');
            auto e = part.find_last_not_of(' ');
            if (b != std::string::npos) out.push_back(part.substr(b, e - b + 1));
            pos = end + 1;
        }
    }
    return out;
}

// ============================================================
// Какой чат анкеты имеет в виду админ
// ============================================================

struct ChatSelector {
    std::optional<long long> chat_id;
    std::optional<std::string> telegram_user_id;
};

// Параметры запроса ?chat_id=&telegram_user_id= и поля тела с теми же именами. Тело важнее
inline ChatSelector chatSelectorFrom(const std::optional<std::string>& query_chat_id,
                                     const std::optional<std::string>& query_user,
                                     const nlohmann::json& body) {
    ChatSelector sel;
    if (query_chat_id) sel.chat_id = to_ll(*query_chat_id, 0);
    if (query_user && !query_user->empty() && *query_user != "None") sel.telegram_user_id = *query_user;

    if (body.contains("chat_id") && body["chat_id"].is_number_integer()) {
        sel.chat_id = body["chat_id"].get<long long>();
    }
    if (body.contains("telegram_user_id")) {
        const auto& u = body["telegram_user_id"];
        if (u.is_string() && !u.get<std::string>().empty()) sel.telegram_user_id = u.get<std::string>();
        if (u.is_number_integer()) sel.telegram_user_id = std::to_string(u.get<long long>());
    }
    if (sel.chat_id && *sel.chat_id <= 0) sel.chat_id.reset();
    return sel;
}

// Без уточнений берётся самый свежий чат анкеты. Чат другой анкеты не выбирается
inline std::optional<Chat> selectChat(const Document& doc, const ChatRegistry& chats,
                                      long long profileId, const ChatSelector& sel) {
    if (sel.chat_id) {
        auto chat = chats.findById(doc, *sel.chat_id);
        if (!chat || chat->profile_id != profileId) return std::nullopt;
        return chat;
    }
    if (sel.telegram_user_id) {
        return chats.find(doc, profileId, sel.telegram_user_id);
    }

    const Chat* latest = nullptr;
    for (const auto& c : doc.chats) {
        if (c.profile_id == profileId && (!latest || c.id > latest->id)) latest = &c;
    }
    if (!latest) return std::nullopt;
    return *latest;
}

inline Chat selectOrCreateChat(Document& doc, const ChatRegistry& chats, long long profileId,
                               const ChatSelector& sel, Timestamp now) {
    if (auto chat = selectChat(doc, chats, profileId, sel)) return *chat;
    if (sel.chat_id) throw NotFoundError("Chat not found");
    return chats.findOrCreate(doc, profileId, sel.telegram_user_id, now);
}
