#pragma once

#include <optional>
#include <string>
#include <vector>

#include "entities.h"
#include "order_ledger.h"

struct MessageDraft {
    Sender sender = Sender::User;
    std::string text;
    std::optional<Attachment> attachment;
};

struct AppendResult {
    ChatMessage message;
    std::optional<Order> booked;  // заказ, переведённый в booked этим сообщением
};

// Строка списка чатов пользователя
struct ChatSummary {
    long long chat_id = 0;
    long long profile_id = 0;
    std::string profile_name;
    std::optional<std::string> profile_photo;
    std::string last_message;
    Timestamp last_message_time{};
    long long unread_count = 0;
};

// Чаты и сообщения. Ввода-вывода нет: вызывающий сохраняет документ сам
class ChatRegistry {
public:
    static const char* const kPaymentKeyword;     // в ответе админа переводит заказ в booked
    static const char* const kConfirmationText;   // системное сообщение после оплаты
    static const char* const kTransactionMarker;  // по нему ищется завершённая сделка

    explicit ChatRegistry(OrderLedger& ledger);

    // Без пользователя ищется старый чат профиля, у которого telegram_user_id не задан
    std::optional<Chat> find(const Document& doc, long long profile_id,
                             const std::optional<std::string>& telegram_user_id) const;
    std::optional<Chat> findById(const Document& doc, long long chat_id) const;

    // Бросает NotFoundError, если нет профиля
    Chat findOrCreate(Document& doc, long long profile_id,
                      const std::optional<std::string>& telegram_user_id, Timestamp now) const;

    // Ответ админа с "payment successful" бронирует последний неоплаченный заказ
    // этого чата и добавляет системное подтверждение
    AppendResult appendMessage(Document& doc, long long chat_id, const MessageDraft& draft,
                               Timestamp now) const;
    ChatMessage appendSystemMessage(Document& doc, long long chat_id, const std::string& text,
                                    Timestamp now) const;

    // Подтверждение заказа по id; в чат пары (профиль, пользователь) пишется системное сообщение
    std::optional<Order> confirmOrder(Document& doc, long long order_id, Timestamp now) const;

    std::vector<ChatMessage> messagesOf(const Document& doc, long long chat_id,
                                        long long after_id = 0) const;

    // Сторона админа: флаг is_read у сообщений пользователя
    std::size_t markRead(Document& doc, long long chat_id) const;
    long long unreadCount(const Document& doc, long long chat_id) const;

    // Сторона пользователя: курсор last_read_message_id
    bool markReadByUser(Document& doc, long long chat_id) const;
    long long userUnreadCount(const Document& doc, const Chat& chat) const;

    bool hasCompletedTransaction(const Document& doc, long long chat_id) const;

    std::vector<ChatSummary> summaries(const Document& doc, const std::string& telegram_user_id) const;

private:
    Chat* chatById(Document& doc, long long chat_id) const;
    ChatMessage push(Document& doc, long long chat_id, const MessageDraft& draft, Timestamp now) const;

    OrderLedger& ledger_;
};
