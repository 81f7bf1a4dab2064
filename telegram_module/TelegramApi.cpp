#include "TelegramApi.h"

using json = nlohmann::json;

std::vector<TelegramUpdate> parseUpdates(const json& response) {
    if (!response.is_object() || !response.value("ok", false)) {
        throw TelegramError("getUpdates failed: " + response.value("description", std::string("no description")));
    }

    std::vector<TelegramUpdate> out;
    if (!response.contains("result") || !response["result"].is_array()) return out;

    for (const auto& upd : response["result"]) {
        TelegramUpdate u;
        u.update_id = upd.value("update_id", 0LL);

        if (upd.contains("callback_query")) {
            const auto& cq = upd["callback_query"];
            u.callback_id = cq.value("id", std::string());
            u.callback_data = cq.value("data", std::string());
            if (cq.contains("from")) u.from_id = cq["from"].value("id", 0LL);
            if (cq.contains("message") && cq["message"].contains("chat")) {
                u.chat_id = cq["message"]["chat"].value("id", 0LL);
            }
        } else if (upd.contains("message")) {
            const auto& msg = upd["message"];
            u.text = msg.value("text", std::string());
            if (msg.contains("from")) u.from_id = msg["from"].value("id", 0LL);
            if (msg.contains("chat")) u.chat_id = msg["chat"].value("id", 0LL);
            if (msg.contains("reply_to_message")) {
                u.reply_to_message_id = msg["reply_to_message"].value("message_id", 0LL);
            }
        }
        // остальные типы апдейтов пропускаем, но update_id нужен для offset
        out.push_back(std::move(u));
    }
    return out;
}

json keyboardJson(const InlineKeyboard& keyboard) {
    json rows = json::array();
    for (const auto& row : keyboard) {
        json buttons = json::array();
        for (const auto& b : row) {
            buttons.push_back({{"text", b.text}, {"callback_data", b.callback_data}});
        }
        rows.push_back(std::move(buttons));
    }
    return json{{"inline_keyboard", rows}};
}
