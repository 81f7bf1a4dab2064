#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

// Куда уходит ответ админа: чат профиля с конкретным пользователем
struct ReplyTarget {
    long long profile_id = 0;
    std::optional<std::string> telegram_user_id;
};

// Режим ответа: после кнопки "Ответить" обычный текст админа уходит в выбранный чат,
// пока не придёт /cancel
class ReplySessions {
public:
    void begin(long long admin_id, const ReplyTarget& target) {
        sessions_[admin_id] = target;
    }

    std::optional<ReplyTarget> current(long long admin_id) const {
        auto it = sessions_.find(admin_id);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    // false, если админ не был в режиме ответа
    bool cancel(long long admin_id) {
        return sessions_.erase(admin_id) > 0;
    }

private:
    std::map<long long, ReplyTarget> sessions_;
};

// message_id уведомления в Telegram -> чат. Нужен для ответа через Reply на уведомление.
// Старые записи вытесняются, чтобы таблица не росла бесконечно
class NotificationMap {
public:
    explicit NotificationMap(std::size_t capacity = 1000) : capacity_(capacity) {}

    void remember(long long message_id, const ReplyTarget& target) {
        if (entries_.emplace(message_id, target).second) {
            order_.push_back(message_id);
        } else {
            entries_[message_id] = target;
        }
        while (order_.size() > capacity_) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
    }

    std::optional<ReplyTarget> lookup(long long message_id) const {
        auto it = entries_.find(message_id);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t size() const { return entries_.size(); }

private:
    std::size_t capacity_;
    std::unordered_map<long long, ReplyTarget> entries_;
    std::deque<long long> order_;
};
