#include "TelegramBridge.h"

#include <algorithm>

#include "crow/logging.h"

#include "db/store_errors.h"
#include "domain/timestamps.h"

static std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

// Обрезка по байтам, не разрывая UTF-8 последовательность
static std::string utf8_prefix(const std::string& s, std::size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

static const char* kHelpText =
    "🤖 <b>Бот для управления чатами</b>\n\n"
    "<b>Команды:</b>\n"
    "/chats - Показать все активные чаты\n"
    "/cancel - Отменить режим ответа\n\n"
    "<b>Как отвечать пользователям:</b>\n"
    "1️⃣ Нажмите кнопку \"✉️ Ответить\" под уведомлением\n"
    "2️⃣ Напишите сообщение - оно отправится пользователю\n"
    "3️⃣ Или просто ответьте (Reply) на уведомление\n\n"
    "<b>Быстрые действия:</b>\n"
    "• \"✅ Payment OK\" - подтвердить оплату\n"
    "• \"📋 Все чаты\" - список всех чатов";

TelegramBridge::TelegramBridge(TelegramApi& api, DocumentStore& store, const ChatRegistry& chats,
                               BridgeConfig config)
    : api_(api), store_(store), chats_(chats), config_(std::move(config)) {}

TelegramBridge::~TelegramBridge() {
    stop(std::chrono::seconds(5));
}

bool TelegramBridge::isAdmin(long long id) const {
    return std::find(config_.admin_ids.begin(), config_.admin_ids.end(), id) != config_.admin_ids.end();
}

void TelegramBridge::say(long long admin_id, const std::string& text, const InlineKeyboard& keyboard,
                         bool html) {
    api_.sendMessage(admin_id, text, keyboard, html);
}

void TelegramBridge::start() {
    if (running_) return;
    primeCursor();
    {
        std::lock_guard<std::mutex> lk(m_);
        finished_ = false;
    }
    running_ = true;
    thread_ = std::thread([this]() { loop(); });
}

void TelegramBridge::stop(std::chrono::milliseconds grace) {
    if (!thread_.joinable()) {
        running_ = false;
        return;
    }

    {
        std::lock_guard<std::mutex> lk(m_);
        running_ = false;
    }
    wake_cv_.notify_all();

    bool done;
    {
        std::unique_lock<std::mutex> lk(m_);
        done = done_cv_.wait_for(lk, grace, [this]() { return finished_; });
    }
    if (!done) {
        CROW_LOG_WARNING << "[bridge] loop did not stop within " << grace.count()
                         << "ms, aborting pending request";
        api_.abortPending();
    }
    thread_.join();
}

void TelegramBridge::pause(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(m_);
    wake_cv_.wait_for(lk, d, [this]() { return !running_.load(); });
}

void TelegramBridge::loop() {
    CROW_LOG_INFO << "[bridge] updates processor started, " << config_.admin_ids.size() << " admins";

    while (running_) {
        try {
            pollOnce();
            pause(config_.idle_pause);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "[bridge] error processing updates: " << e.what();
            pause(config_.error_backoff);
        }
    }

    {
        std::lock_guard<std::mutex> lk(m_);
        finished_ = true;
    }
    done_cv_.notify_all();
    CROW_LOG_INFO << "[bridge] updates processor stopped gracefully";
}

void TelegramBridge::primeCursor() {
    Document doc = store_.load();
    notify_cursor_ = std::max(doc.counters.messages, maxId(doc.messages));
    notify_failures_ = 0;
}

void TelegramBridge::pollOnce() {
    notifyNewMessages();

    auto updates = api_.getUpdates(offset_, config_.poll_timeout_seconds);
    for (const auto& upd : updates) {
        offset_ = std::max(offset_, upd.update_id + 1);
        try {
            handleUpdate(upd);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "[bridge] update " << upd.update_id << " failed: " << e.what();
            if (!isAdmin(upd.from_id)) continue;
            try {
                say(upd.from_id, std::string("❌ Ошибка: ") + e.what());
            } catch (const TelegramError& te) {
                CROW_LOG_ERROR << "[bridge] cannot report error to admin " << upd.from_id << ": " << te.what();
            }
        }
    }
}

std::size_t TelegramBridge::notifyNewMessages() {
    if (config_.admin_ids.empty()) return 0;

    Document doc = store_.load();
    std::size_t sent = 0;

    for (const auto& m : doc.messages) {
        if (m.id <= notify_cursor_) continue;

        auto chat = chats_.findById(doc, m.chat_id);
        if (m.sender != Sender::User || !chat) {
            notify_cursor_ = m.id;
            continue;
        }
        ReplyTarget target{chat->profile_id, chat->telegram_user_id};

        std::string text = "🔔 <b>Новое сообщение от пользователя</b>\n\n";
        text += "👤 <b>Профиль:</b> " + html_escape(chat->profile_name) + "\n";
        if (!m.text.empty()) text += "💬 <b>Сообщение:</b> " + html_escape(m.text) + "\n";
        if (m.attachment) text += "📎 <b>Файл:</b> Прикреплен\n";
        text += "\n⏰ <b>Время:</b> " + formatTimestamp(m.created_at) + " UTC";

        InlineKeyboard keyboard = {
            {{"✉️ Ответить", CommandParser::replyData(target.profile_id, target.telegram_user_id)},
             {"✅ Payment OK", CommandParser::paymentData(target.profile_id, target.telegram_user_id)}},
            {{"📋 Все чаты", "list_chats"}},
        };

        std::size_t delivered = 0;
        for (long long admin_id : config_.admin_ids) {
            try {
                long long message_id = api_.sendMessage(admin_id, text, keyboard, true);
                if (message_id > 0) mapping_.remember(message_id, target);
                ++delivered;
            } catch (const TelegramError& e) {
                CROW_LOG_ERROR << "[bridge] failed to notify admin " << admin_id << ": " << e.what();
            }
        }

        // Ни одному админу не доставлено: курсор стоит, повторим на следующей итерации
        if (delivered == 0 && ++notify_failures_ < config_.notify_attempts) {
            CROW_LOG_WARNING << "[bridge] message #" << m.id << " not delivered, attempt "
                             << notify_failures_ << " of " << config_.notify_attempts;
            break;
        }
        if (delivered == 0) {
            CROW_LOG_ERROR << "[bridge] giving up on message #" << m.id << " after "
                           << notify_failures_ << " attempts";
        }
        notify_failures_ = 0;
        notify_cursor_ = m.id;
        sent += delivered;
    }
    if (sent > 0) CROW_LOG_INFO << "[bridge] sent " << sent << " notifications";
    return sent;
}

void TelegramBridge::handleUpdate(const TelegramUpdate& upd) {
    if (!isAdmin(upd.from_id)) {
        CROW_LOG_DEBUG << "[bridge] ignoring update from non-admin " << upd.from_id;
        return;
    }

    if (upd.isCallback()) {
        handleCallback(upd.from_id, upd);
        return;
    }
    if (!upd.text.empty() && upd.text[0] == '/') {
        handleCommand(upd.from_id, upd.text);
        return;
    }
    handleText(upd.from_id, upd);
}

void TelegramBridge::sendHelp(long long admin_id) {
    say(admin_id, kHelpText, {}, true);
}

void TelegramBridge::handleCommand(long long admin_id, const std::string& text) {
    switch (parser_.parse(text)) {
        case Command::START:
        case Command::HELP:
            sendHelp(admin_id);
            break;
        case Command::CHATS:
            showChats(admin_id);
            break;
        case Command::CANCEL:
            if (sessions_.cancel(admin_id)) {
                say(admin_id, "✅ Режим ответа отменен");
            } else {
                say(admin_id, "ℹ️ Вы не в режиме ответа");
            }
            break;
        case Command::UNKNOWN:
            say(admin_id, "Нет такой команды. /help - список команд");
            break;
    }
}

void TelegramBridge::handleCallback(long long admin_id, const TelegramUpdate& upd) {
    try {
        api_.answerCallback(*upd.callback_id);
    } catch (const TelegramError& e) {
        CROW_LOG_WARNING << "[bridge] answerCallbackQuery failed: " << e.what();
    }

    CallbackCommand cmd = parser_.parseCallback(upd.callback_data);
    ReplyTarget target{cmd.profile_id, cmd.telegram_user_id};

    switch (cmd.action) {
        case CallbackAction::REPLY: {
            sessions_.begin(admin_id, target);

            Document doc = store_.load();
            std::string profile_name = "Unknown";
            for (const auto& p : doc.profiles) {
                if (p.id == target.profile_id) profile_name = p.name;
            }
            std::string user_info = target.telegram_user_id ? " (User: " + *target.telegram_user_id + ")" : "";
            say(admin_id,
                "✍️ Режим ответа активирован для: <b>" + html_escape(profile_name) + "</b>" +
                    html_escape(user_info) +
                    "\n\nНапишите сообщение, и оно будет отправлено пользователю.\nДля отмены используйте /cancel",
                {}, true);
            break;
        }
        case CallbackAction::PAYMENT: {
            auto booked = replyFromTelegram(target, ChatRegistry::kPaymentKeyword);
            if (booked) {
                say(admin_id, "✅ Подтверждение оплаты отправлено! Заказ " + booked->order_number +
                                  " переведен в статус 'Booked'.");
            } else {
                say(admin_id, "ℹ️ Сообщение отправлено, но неоплаченный заказ не найден.");
            }
            break;
        }
        case CallbackAction::LIST_CHATS:
            showChats(admin_id);
            break;
        case CallbackAction::UNKNOWN:
            CROW_LOG_WARNING << "[bridge] unknown callback data '" << upd.callback_data << "'";
            break;
    }
}

void TelegramBridge::handleText(long long admin_id, const TelegramUpdate& upd) {
    std::optional<ReplyTarget> target;
    std::string ack;

    if (upd.reply_to_message_id) {
        target = mapping_.lookup(*upd.reply_to_message_id);
        ack = "✅ Ответ отправлен пользователю!";
    }
    if (!target) {
        target = sessions_.current(admin_id);
        ack = "✅ Ответ отправлен! Отправьте еще сообщение или /cancel для выхода.";
    }
    if (!target) {
        CROW_LOG_DEBUG << "[bridge] admin " << admin_id << " wrote outside of reply mode";
        return;
    }

    try {
        replyFromTelegram(*target, upd.text);
    } catch (const ValidationError&) {
        say(admin_id, "❌ Пользователю можно отправить только текст");
        return;
    } catch (const NotFoundError&) {
        say(admin_id, "❌ Анкета не найдена, режим ответа отменен");
        sessions_.cancel(admin_id);
        return;
    }
    say(admin_id, ack);
}

std::optional<Order> TelegramBridge::replyFromTelegram(const ReplyTarget& target, const std::string& text) {
    const Timestamp now = nowUtc();
    AppendResult result = store_.update([&](Document& doc) {
        Chat chat = chats_.findOrCreate(doc, target.profile_id, target.telegram_user_id, now);
        MessageDraft draft;
        draft.sender = Sender::Admin;
        draft.text = text;
        return chats_.appendMessage(doc, chat.id, draft, now);
    });

    CROW_LOG_INFO << "[bridge] admin reply from Telegram sent to profile " << target.profile_id
                  << ", user " << target.telegram_user_id.value_or("-");
    if (result.booked) {
        CROW_LOG_INFO << "[bridge] order #" << result.booked->id << " marked as booked (from Telegram)";
    }
    return result.booked;
}

void TelegramBridge::showChats(long long admin_id) {
    Document doc = store_.load();
    if (doc.chats.empty()) {
        say(admin_id, "📭 Нет активных чатов");
        return;
    }

    // Последние 10 чатов
    auto first = doc.chats.size() > 10 ? doc.chats.end() - 10 : doc.chats.begin();
    for (auto it = first; it != doc.chats.end(); ++it) {
        const Chat& chat = *it;

        std::string last_text = "No messages";
        for (const auto& m : doc.messages) {
            if (m.chat_id == chat.id) last_text = m.text.empty() && m.attachment ? "📎" : utf8_prefix(m.text, 50);
        }

        std::string info = "👤 <b>" + html_escape(chat.profile_name) + "</b>";
        if (chat.telegram_user_id) info += "\n👤 User: " + html_escape(*chat.telegram_user_id);
        info += "\n💬 " + html_escape(last_text);

        InlineKeyboard keyboard = {
            {{"✉️ Ответить", CommandParser::replyData(chat.profile_id, chat.telegram_user_id)}},
        };
        say(admin_id, info, keyboard, true);
    }

    say(admin_id, "📊 Всего чатов: " + std::to_string(doc.chats.size()));
}
