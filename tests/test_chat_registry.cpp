#include <catch2/catch.hpp>

#include "db/store_errors.h"
#include "domain/chat_registry.h"
#include "test_support.h"

using namespace std::chrono_literals;

static MessageDraft textFrom(Sender sender, const std::string& text) {
    MessageDraft d;
    d.sender = sender;
    d.text = text;
    return d;
}

static Order unpaidOrder(OrderLedger& ledger, Document& doc, long long profile_id,
                         const std::string& user, Timestamp now) {
    QuoteRequest q;
    q.profile_id = profile_id;
    q.telegram_user_id = user;
    q.amount = 100.0;
    q.crypto_type = "trc20";
    return ledger.quote(doc, q, now);
}

TEST_CASE("ChatRegistry - one chat per profile and user", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();

    SECTION("Same pair returns the same chat") {
        Chat a = chats.findOrCreate(doc, 1, std::string("42"), now);
        Chat b = chats.findOrCreate(doc, 1, std::string("42"), now + 1min);
        REQUIRE(a.id == b.id);
        REQUIRE(doc.chats.size() == 1);
        REQUIRE(a.profile_name == "Anna");
    }

    SECTION("Other user gets a separate chat") {
        Chat a = chats.findOrCreate(doc, 1, std::string("42"), now);
        Chat b = chats.findOrCreate(doc, 1, std::string("43"), now);
        REQUIRE(a.id != b.id);
        REQUIRE(doc.chats.size() == 2);
    }

    SECTION("Legacy chat without user is matched only without user") {
        Chat legacy = chats.findOrCreate(doc, 1, std::nullopt, now);
        REQUIRE_FALSE(legacy.telegram_user_id);

        REQUIRE(chats.find(doc, 1, std::nullopt)->id == legacy.id);
        REQUIRE_FALSE(chats.find(doc, 1, std::string("42")));
    }

    SECTION("Missing profile") {
        REQUIRE_THROWS_AS(chats.findOrCreate(doc, 5, std::string("42"), now), NotFoundError);
        REQUIRE(doc.chats.empty());
    }
}

TEST_CASE("ChatRegistry - messages", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();
    Chat chat = chats.findOrCreate(doc, 1, std::string("42"), now);

    SECTION("Ids are global and increasing") {
        Chat other = chats.findOrCreate(doc, 1, std::string("43"), now);
        auto m1 = chats.appendMessage(doc, chat.id, textFrom(Sender::User, "hi"), now).message;
        auto m2 = chats.appendMessage(doc, other.id, textFrom(Sender::User, "hello"), now).message;
        auto m3 = chats.appendMessage(doc, chat.id, textFrom(Sender::Admin, "hey"), now).message;

        REQUIRE(m1.id < m2.id);
        REQUIRE(m2.id < m3.id);
        REQUIRE(chats.messagesOf(doc, chat.id).size() == 2);
        REQUIRE(chats.messagesOf(doc, chat.id, m1.id).size() == 1);
        REQUIRE(chats.messagesOf(doc, chat.id, m3.id).empty());
    }

    SECTION("Attachment without text") {
        MessageDraft d;
        d.sender = Sender::User;
        d.attachment = Attachment{"/uploads/x.png", "image", "x.png"};
        auto m = chats.appendMessage(doc, chat.id, d, now).message;
        REQUIRE(m.attachment);
        REQUIRE(m.attachment->kind == "image");
        REQUIRE_FALSE(m.is_read);
    }

    SECTION("Empty message or unknown chat") {
        REQUIRE_THROWS_AS(chats.appendMessage(doc, chat.id, textFrom(Sender::User, ""), now), ValidationError);

        MessageDraft bad;
        bad.attachment = Attachment{"", "file", "a.bin"};
        REQUIRE_THROWS_AS(chats.appendMessage(doc, chat.id, bad, now), ValidationError);

        REQUIRE_THROWS_AS(chats.appendMessage(doc, 99, textFrom(Sender::User, "hi"), now), NotFoundError);
        REQUIRE(doc.messages.empty());
    }
}

TEST_CASE("ChatRegistry - payment keyword", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();
    Chat chat = chats.findOrCreate(doc, 1, std::string("42"), now);

    SECTION("Admin reply books the order and posts a confirmation") {
        Order order = unpaidOrder(ledger, doc, 1, "42", now);

        auto result = chats.appendMessage(doc, chat.id, textFrom(Sender::Admin, "Payment Successful! Thanks"), now);
        REQUIRE(result.booked);
        REQUIRE(result.booked->id == order.id);
        REQUIRE(doc.orders[0].status == OrderStatus::Booked);

        auto messages = chats.messagesOf(doc, chat.id);
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[1].sender == Sender::System);
        REQUIRE(messages[1].text == ChatRegistry::kConfirmationText);
        REQUIRE(chats.hasCompletedTransaction(doc, chat.id));
    }

    SECTION("Order of another user is not touched") {
        unpaidOrder(ledger, doc, 1, "43", now);

        auto result = chats.appendMessage(doc, chat.id, textFrom(Sender::Admin, "payment successful"), now);
        REQUIRE_FALSE(result.booked);
        REQUIRE(doc.orders[0].status == OrderStatus::Unpaid);
        REQUIRE(chats.messagesOf(doc, chat.id).size() == 1);
        REQUIRE_FALSE(chats.hasCompletedTransaction(doc, chat.id));
    }

    SECTION("Keyword from the user side does nothing") {
        unpaidOrder(ledger, doc, 1, "42", now);
        auto result = chats.appendMessage(doc, chat.id, textFrom(Sender::User, "payment successful"), now);
        REQUIRE_FALSE(result.booked);
        REQUIRE(doc.orders[0].status == OrderStatus::Unpaid);
    }
}

TEST_CASE("ChatRegistry - admin confirmation", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();

    Order order = unpaidOrder(ledger, doc, 1, "42", now);

    SECTION("Confirmation creates the chat and writes the system message") {
        auto confirmed = chats.confirmOrder(doc, order.id, now);
        REQUIRE(confirmed);
        REQUIRE(confirmed->status == OrderStatus::Booked);

        auto chat = chats.find(doc, 1, std::string("42"));
        REQUIRE(chat);
        auto messages = chats.messagesOf(doc, chat->id);
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0].sender == Sender::System);
    }

    SECTION("Second confirmation does not repeat the message") {
        chats.confirmOrder(doc, order.id, now);
        chats.confirmOrder(doc, order.id, now + 1min);
        REQUIRE(doc.messages.size() == 1);
    }

    SECTION("Unknown order") {
        REQUIRE_FALSE(chats.confirmOrder(doc, 999, now));
    }
}

TEST_CASE("ChatRegistry - read state", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();
    Chat chat = chats.findOrCreate(doc, 1, std::string("42"), now);

    chats.appendMessage(doc, chat.id, textFrom(Sender::User, "one"), now);
    chats.appendMessage(doc, chat.id, textFrom(Sender::User, "two"), now);
    chats.appendMessage(doc, chat.id, textFrom(Sender::Admin, "reply"), now);

    SECTION("Admin side counts unread user messages") {
        REQUIRE(chats.unreadCount(doc, chat.id) == 2);
        REQUIRE(chats.markRead(doc, chat.id) == 2);
        REQUIRE(chats.unreadCount(doc, chat.id) == 0);
        REQUIRE(chats.markRead(doc, chat.id) == 0);
    }

    SECTION("User side counts admin messages after the cursor") {
        Chat current = *chats.findById(doc, chat.id);
        REQUIRE(chats.userUnreadCount(doc, current) == 1);

        REQUIRE(chats.markReadByUser(doc, chat.id));
        REQUIRE_FALSE(chats.markReadByUser(doc, chat.id));

        current = *chats.findById(doc, chat.id);
        REQUIRE(chats.userUnreadCount(doc, current) == 0);

        chats.appendMessage(doc, chat.id, textFrom(Sender::Admin, "again"), now);
        REQUIRE(chats.userUnreadCount(doc, current) == 1);
    }
}

TEST_CASE("ChatRegistry - user chat list", "[chats]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    Document doc;
    addProfile(doc, "Anna");
    addProfile(doc, "Maria");
    addProfile(doc, "Olga");
    const Timestamp now = testNow();

    Chat anna = chats.findOrCreate(doc, 1, std::string("42"), now);
    Chat maria = chats.findOrCreate(doc, 2, std::string("42"), now);
    chats.findOrCreate(doc, 3, std::string("42"), now - 1h);
    chats.findOrCreate(doc, 1, std::string("43"), now);

    chats.appendMessage(doc, anna.id, textFrom(Sender::User, "hi"), now + 1min);
    chats.appendMessage(doc, anna.id, textFrom(Sender::Admin, "hello"), now + 2min);

    MessageDraft video;
    video.sender = Sender::User;
    video.attachment = Attachment{"/uploads/clip.mp4", "video", "clip.mp4"};
    chats.appendMessage(doc, maria.id, video, now + 5min);

    auto list = chats.summaries(doc, "42");
    REQUIRE(list.size() == 3);

    REQUIRE(list[0].profile_name == "Maria");
    REQUIRE(list[0].last_message == "🎥 Video");

    REQUIRE(list[1].profile_name == "Anna");
    REQUIRE(list[1].last_message == "hello");
    REQUIRE(list[1].unread_count == 1);
    REQUIRE(list[1].profile_photo == std::string("/uploads/Anna.jpg"));

    REQUIRE(list[2].profile_name == "Olga");
    REQUIRE(list[2].last_message == "No messages yet");
    REQUIRE(list[2].unread_count == 0);
}
