#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "TelegramApi.h"

// Bot API поверх libcurl
class TelegramClient : public TelegramApi {
public:
    explicit TelegramClient(const std::string& botToken,
                            const std::string& apiRoot = "https://api.telegram.org");
    ~TelegramClient() override;

    TelegramClient(const TelegramClient&) = delete;
    TelegramClient& operator=(const TelegramClient&) = delete;

    std::vector<TelegramUpdate> getUpdates(long long offset, int timeout_seconds) override;
    long long sendMessage(long long chat_id, const std::string& text,
                          const InlineKeyboard& keyboard, bool html) override;
    void answerCallback(const std::string& callback_id) override;
    void abortPending() override;

private:
    nlohmann::json call(const std::string& method, const nlohmann::json& body, long timeout_seconds);

private:
    std::string apiBase;  // https://api.telegram.org/bot<TOKEN>

    std::atomic<bool> abort_{false};  // читается из progress-callback curl

    // один sendMessage за раз
    std::mutex send_m;
};
