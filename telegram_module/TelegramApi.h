#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct InlineButton {
    std::string text;
    std::string callback_data;
};

// Ряды кнопок под сообщением
using InlineKeyboard = std::vector<std::vector<InlineButton>>;

// Нас интересуют только message и callback_query
struct TelegramUpdate {
    long long update_id = 0;
    long long from_id = 0;
    long long chat_id = 0;

    std::string text;
    std::optional<long long> reply_to_message_id;

    std::optional<std::string> callback_id;
    std::string callback_data;

    bool isCallback() const { return callback_id.has_value(); }
};

// Ошибка транспорта или ответ Bot API с ok=false
class TelegramError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TelegramApi {
public:
    virtual ~TelegramApi() = default;

    // Long-poll. Пустой вектор, если за timeout_seconds ничего не пришло
    virtual std::vector<TelegramUpdate> getUpdates(long long offset, int timeout_seconds) = 0;

    // Возвращает message_id отправленного сообщения
    virtual long long sendMessage(long long chat_id, const std::string& text,
                                  const InlineKeyboard& keyboard, bool html) = 0;

    virtual void answerCallback(const std::string& callback_id) = 0;

    // Прерывает висящий запрос (принудительная остановка)
    virtual void abortPending() = 0;
};

// Разбор ответа getUpdates: {"ok": true, "result": [...]}
std::vector<TelegramUpdate> parseUpdates(const nlohmann::json& response);

nlohmann::json keyboardJson(const InlineKeyboard& keyboard);
