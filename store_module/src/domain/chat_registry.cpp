#include "chat_registry.h"

#include <algorithm>

#include "crow/logging.h"

#include "../db/store_errors.h"

const char* const ChatRegistry::kPaymentKeyword = "payment successful";
const char* const ChatRegistry::kConfirmationText = "Transaction successful, your booking has been confirmed";
const char* const ChatRegistry::kTransactionMarker = "transaction successful";

ChatRegistry::ChatRegistry(OrderLedger& ledger) : ledger_(ledger) {}

std::optional<Chat> ChatRegistry::find(const Document& doc, long long profile_id,
                                       const std::optional<std::string>& telegram_user_id) const {
    for (const auto& chat : doc.chats) {
        if (chat.profile_id == profile_id && chat.telegram_user_id == telegram_user_id) return chat;
    }
    return std::nullopt;
}

std::optional<Chat> ChatRegistry::findById(const Document& doc, long long chat_id) const {
    for (const auto& chat : doc.chats) {
        if (chat.id == chat_id) return chat;
    }
    return std::nullopt;
}

Chat* ChatRegistry::chatById(Document& doc, long long chat_id) const {
    for (auto& chat : doc.chats) {
        if (chat.id == chat_id) return &chat;
    }
    return nullptr;
}

Chat ChatRegistry::findOrCreate(Document& doc, long long profile_id,
                                const std::optional<std::string>& telegram_user_id, Timestamp now) const {
    if (auto existing = find(doc, profile_id, telegram_user_id)) return *existing;

    auto profile = std::find_if(doc.profiles.begin(), doc.profiles.end(),
                                [&](const Profile& p) { return p.id == profile_id; });
    if (profile == doc.profiles.end()) {
        throw NotFoundError("profile " + std::to_string(profile_id) + " not found");
    }

    Chat chat;
    chat.id = nextId(doc.counters.chats, doc.chats);
    chat.profile_id = profile_id;
    chat.profile_name = profile->name;
    chat.telegram_user_id = telegram_user_id;
    chat.created_at = now;
    doc.chats.push_back(chat);

    CROW_LOG_INFO << "[chats] created chat #" << chat.id << " for profile " << profile_id
                  << ", user " << telegram_user_id.value_or("-");
    return chat;
}

ChatMessage ChatRegistry::push(Document& doc, long long chat_id, const MessageDraft& draft,
                               Timestamp now) const {
    ChatMessage message;
    message.id = nextId(doc.counters.messages, doc.messages);
    message.chat_id = chat_id;
    message.sender = draft.sender;
    message.text = draft.text;
    message.attachment = draft.attachment;
    message.is_read = false;
    message.created_at = now;
    doc.messages.push_back(message);
    return message;
}

AppendResult ChatRegistry::appendMessage(Document& doc, long long chat_id, const MessageDraft& draft,
                                         Timestamp now) const {
    if (draft.text.empty() && !draft.attachment) {
        throw ValidationError("text or file is required");
    }
    if (draft.attachment && draft.attachment->url.empty()) {
        throw ValidationError("attachment url is required");
    }

    const Chat* chat = chatById(doc, chat_id);
    if (!chat) throw NotFoundError("chat " + std::to_string(chat_id) + " not found");
    const long long profile_id = chat->profile_id;
    const std::optional<std::string> telegram_user_id = chat->telegram_user_id;

    AppendResult result;
    result.message = push(doc, chat_id, draft, now);

    if (draft.sender == Sender::Admin && containsIgnoreCase(draft.text, kPaymentKeyword)) {
        result.booked = ledger_.book(doc, profile_id, telegram_user_id, now);
        if (result.booked) {
            appendSystemMessage(doc, chat_id, kConfirmationText, now);
        }
    }
    return result;
}

ChatMessage ChatRegistry::appendSystemMessage(Document& doc, long long chat_id, const std::string& text,
                                              Timestamp now) const {
    if (text.empty()) throw ValidationError("text is required");
    if (!chatById(doc, chat_id)) throw NotFoundError("chat " + std::to_string(chat_id) + " not found");

    MessageDraft draft;
    draft.sender = Sender::System;
    draft.text = text;
    return push(doc, chat_id, draft, now);
}

std::optional<Order> ChatRegistry::confirmOrder(Document& doc, long long order_id, Timestamp now) const {
    auto it = std::find_if(doc.orders.begin(), doc.orders.end(),
                           [order_id](const Order& o) { return o.id == order_id; });
    if (it == doc.orders.end()) return std::nullopt;
    const bool was_unpaid = it->status == OrderStatus::Unpaid;

    auto order = ledger_.confirm(doc, order_id, now);
    if (!order || !was_unpaid || !order->telegram_user_id) return order;

    bool profile_exists = std::any_of(doc.profiles.begin(), doc.profiles.end(),
                                      [&](const Profile& p) { return p.id == order->profile_id; });
    if (!profile_exists) {
        CROW_LOG_WARNING << "[chats] order #" << order_id << " confirmed, profile "
                         << order->profile_id << " no longer exists";
        return order;
    }

    Chat chat = findOrCreate(doc, order->profile_id, order->telegram_user_id, now);
    appendSystemMessage(doc, chat.id, kConfirmationText, now);
    return order;
}

std::vector<ChatMessage> ChatRegistry::messagesOf(const Document& doc, long long chat_id,
                                                  long long after_id) const {
    std::vector<ChatMessage> result;
    for (const auto& m : doc.messages) {
        if (m.chat_id == chat_id && m.id > after_id) result.push_back(m);
    }
    return result;
}

std::size_t ChatRegistry::markRead(Document& doc, long long chat_id) const {
    std::size_t changed = 0;
    for (auto& m : doc.messages) {
        if (m.chat_id == chat_id && m.sender == Sender::User && !m.is_read) {
            m.is_read = true;
            ++changed;
        }
    }
    return changed;
}

long long ChatRegistry::unreadCount(const Document& doc, long long chat_id) const {
    return std::count_if(doc.messages.begin(), doc.messages.end(), [chat_id](const ChatMessage& m) {
        return m.chat_id == chat_id && m.sender == Sender::User && !m.is_read;
    });
}

bool ChatRegistry::markReadByUser(Document& doc, long long chat_id) const {
    Chat* chat = chatById(doc, chat_id);
    if (!chat) return false;

    long long max_id = 0;
    for (const auto& m : doc.messages) {
        if (m.chat_id == chat_id && m.id > max_id) max_id = m.id;
    }
    if (max_id == 0 || max_id == chat->last_read_message_id) return false;

    chat->last_read_message_id = max_id;
    return true;
}

long long ChatRegistry::userUnreadCount(const Document& doc, const Chat& chat) const {
    return std::count_if(doc.messages.begin(), doc.messages.end(), [&chat](const ChatMessage& m) {
        return m.chat_id == chat.id && m.sender == Sender::Admin && m.id > chat.last_read_message_id;
    });
}

bool ChatRegistry::hasCompletedTransaction(const Document& doc, long long chat_id) const {
    return std::any_of(doc.messages.begin(), doc.messages.end(), [chat_id](const ChatMessage& m) {
        return m.chat_id == chat_id && m.sender == Sender::System &&
               containsIgnoreCase(m.text, kTransactionMarker);
    });
}

static std::string previewOf(const ChatMessage& m) {
    if (!m.attachment) return m.text;
    if (m.attachment->kind == "image") return "📷 Image";
    if (m.attachment->kind == "video") return "🎥 Video";
    return "📎 File";
}

std::vector<ChatSummary> ChatRegistry::summaries(const Document& doc,
                                                 const std::string& telegram_user_id) const {
    std::vector<ChatSummary> result;
    for (const auto& chat : doc.chats) {
        if (chat.telegram_user_id != telegram_user_id) continue;

        auto profile = std::find_if(doc.profiles.begin(), doc.profiles.end(),
                                    [&](const Profile& p) { return p.id == chat.profile_id; });
        if (profile == doc.profiles.end()) continue;

        ChatSummary item;
        item.chat_id = chat.id;
        item.profile_id = chat.profile_id;
        item.profile_name = profile->name;
        if (!profile->photos.empty()) item.profile_photo = profile->photos.front();

        const ChatMessage* last = nullptr;
        for (const auto& m : doc.messages) {
            if (m.chat_id != chat.id) continue;
            if (!last || m.created_at > last->created_at ||
                (m.created_at == last->created_at && m.id > last->id)) {
                last = &m;
            }
        }
        if (last) {
            item.last_message = previewOf(*last);
            item.last_message_time = last->created_at;
        } else {
            item.last_message = "No messages yet";
            item.last_message_time = chat.created_at;
        }
        item.unread_count = userUnreadCount(doc, chat);
        result.push_back(std::move(item));
    }

    std::stable_sort(result.begin(), result.end(), [](const ChatSummary& a, const ChatSummary& b) {
        return a.last_message_time > b.last_message_time;
    });
    return result;
}
