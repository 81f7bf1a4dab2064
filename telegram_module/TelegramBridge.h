#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "db/document_store.h"
#include "domain/chat_registry.h"

#include "CommandParser.h"
#include "ReplySessions.h"
#include "TelegramApi.h"

struct BridgeConfig {
    std::vector<long long> admin_ids;
    int poll_timeout_seconds = 25;
    std::chrono::milliseconds idle_pause{1000};
    std::chrono::milliseconds error_backoff{5000};
    int notify_attempts = 5;  // итераций на одно недоставленное уведомление
};

// Бот для администратора:
// - пересылает в Telegram новые сообщения пользователей (их пишет публичный процесс в тот же data.json)
// - ответы админа (кнопка, Reply на уведомление, режим ответа) записывает в чат
// - "Payment OK" бронирует заказ через ChatRegistry
class TelegramBridge {
public:
    TelegramBridge(TelegramApi& api, DocumentStore& store, const ChatRegistry& chats, BridgeConfig config);
    ~TelegramBridge();

    TelegramBridge(const TelegramBridge&) = delete;
    TelegramBridge& operator=(const TelegramBridge&) = delete;

    void start();

    // Мягкая остановка: ждём завершения текущей итерации не дольше grace,
    // потом обрываем висящий long-poll
    void stop(std::chrono::milliseconds grace);

    bool running() const { return running_; }

    // Курсор уведомлений = последний выданный id сообщения: старые сообщения не рассылаются
    void primeCursor();

    // Одна итерация цикла: уведомления, затем getUpdates и обработка
    void pollOnce();

    std::size_t notifyNewMessages();
    void handleUpdate(const TelegramUpdate& upd);

    long long offset() const { return offset_; }
    long long notificationCursor() const { return notify_cursor_; }

private:
    void loop();
    void pause(std::chrono::milliseconds d);

    bool isAdmin(long long id) const;

    void handleCommand(long long admin_id, const std::string& text);
    void handleCallback(long long admin_id, const TelegramUpdate& upd);
    void handleText(long long admin_id, const TelegramUpdate& upd);

    void showChats(long long admin_id);
    void sendHelp(long long admin_id);

    // Записывает ответ админа в чат. Возвращает забронированный заказ, если он был
    std::optional<Order> replyFromTelegram(const ReplyTarget& target, const std::string& text);

    void say(long long admin_id, const std::string& text, const InlineKeyboard& keyboard = {},
             bool html = false);

private:
    TelegramApi& api_;
    DocumentStore& store_;
    const ChatRegistry& chats_;
    BridgeConfig config_;
    CommandParser parser_;

    ReplySessions sessions_;
    NotificationMap mapping_;

    long long offset_ = 0;
    long long notify_cursor_ = 0;
    int notify_failures_ = 0;

    std::atomic<bool> running_{false};
    std::mutex m_;
    std::condition_variable wake_cv_;
    bool finished_ = true;
    std::condition_variable done_cv_;
    std::thread thread_;
};
