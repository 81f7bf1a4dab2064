#include "CommandParser.h"

#include <cctype>
#include <stdexcept>

static std::string first_token(const std::string& text) {
    // Берем первое "слово" (до пробела)
    std::string t = text;
    auto pos = t.find(' ');
    if (pos != std::string::npos) t = t.substr(0, pos);

    // "/chats@my_bot" в групповых чатах
    auto at = t.find('@');
    if (at != std::string::npos) t = t.substr(0, at);

    // Убираем ведущий '/'
    if (!t.empty() && t[0] == '/') t = t.substr(1);

    // Приводим к lower (ascii команды)
    for (char& c : t) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return t;
}

Command CommandParser::parse(const std::string& text) const {
    if (text.empty() || text[0] != '/') return Command::UNKNOWN;
    const std::string cmd = first_token(text);

    if (cmd == "start") return Command::START;
    if (cmd == "help") return Command::HELP;
    if (cmd == "chats") return Command::CHATS;
    if (cmd == "cancel") return Command::CANCEL;

    return Command::UNKNOWN;
}

static bool parse_target(const std::string& rest, CallbackCommand& out) {
    // "<profile>" или "<profile>_<user>"
    auto sep = rest.find('_');
    const std::string profile = rest.substr(0, sep);
    if (profile.empty()) return false;
    for (char c : profile) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        out.profile_id = std::stoll(profile);
    } catch (const std::out_of_range&) {
        return false;
    }

    if (sep != std::string::npos) {
        std::string user = rest.substr(sep + 1);
        // "None" пишет старая версия бота для чатов без пользователя
        if (!user.empty() && user != "None") out.telegram_user_id = user;
    }
    return true;
}

CallbackCommand CommandParser::parseCallback(const std::string& data) const {
    CallbackCommand cmd;
    if (data == "list_chats") {
        cmd.action = CallbackAction::LIST_CHATS;
        return cmd;
    }

    static const std::string kReply = "reply_";
    static const std::string kPayment = "payment_";

    if (data.compare(0, kReply.size(), kReply) == 0) {
        if (parse_target(data.substr(kReply.size()), cmd)) cmd.action = CallbackAction::REPLY;
    } else if (data.compare(0, kPayment.size(), kPayment) == 0) {
        if (parse_target(data.substr(kPayment.size()), cmd)) cmd.action = CallbackAction::PAYMENT;
    }

    if (cmd.action == CallbackAction::UNKNOWN) {
        cmd.profile_id = 0;
        cmd.telegram_user_id.reset();
    }
    return cmd;
}

static std::string with_user(const std::string& prefix, long long profile_id,
                             const std::optional<std::string>& telegram_user_id) {
    std::string data = prefix + std::to_string(profile_id);
    if (telegram_user_id) data += "_" + *telegram_user_id;
    return data;
}

std::string CommandParser::replyData(long long profile_id, const std::optional<std::string>& telegram_user_id) {
    return with_user("reply_", profile_id, telegram_user_id);
}

std::string CommandParser::paymentData(long long profile_id, const std::optional<std::string>& telegram_user_id) {
    return with_user("payment_", profile_id, telegram_user_id);
}
