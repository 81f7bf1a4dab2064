#pragma once

#include <optional>
#include <string>

// Команды администратора в личке с ботом

enum class Command {
    START,
    HELP,
    CHATS,
    CANCEL,
    UNKNOWN
};

// Кнопки под уведомлениями:
// reply_<profile>[_<user>], payment_<profile>[_<user>], list_chats
enum class CallbackAction {
    REPLY,
    PAYMENT,
    LIST_CHATS,
    UNKNOWN
};

struct CallbackCommand {
    CallbackAction action = CallbackAction::UNKNOWN;
    long long profile_id = 0;
    std::optional<std::string> telegram_user_id;
};

class CommandParser {
public:
    Command parse(const std::string& text) const;
    CallbackCommand parseCallback(const std::string& data) const;

    static std::string replyData(long long profile_id, const std::optional<std::string>& telegram_user_id);
    static std::string paymentData(long long profile_id, const std::optional<std::string>& telegram_user_id);
};
