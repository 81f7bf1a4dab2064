#include <catch2/catch.hpp>

#include <cctype>
#include <cmath>
#include <set>

#include "db/store_errors.h"
#include "domain/order_ledger.h"
#include "test_support.h"

using namespace std::chrono_literals;

static QuoteRequest quoteFor(long long profile_id, const std::string& user, double amount) {
    QuoteRequest q;
    q.profile_id = profile_id;
    q.telegram_user_id = user;
    q.amount = amount;
    q.crypto_type = "trc20";
    return q;
}

TEST_CASE("OrderLedger - quote", "[ledger]") {
    OrderLedger ledger(42);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();

    SECTION("Bonus is added to the total") {
        doc.settings.bonus_percentage = 5.0;
        Order order = ledger.quote(doc, quoteFor(1, "42", 100.0), now);

        REQUIRE(order.amount == Approx(100.0));
        REQUIRE(order.bonus_amount == Approx(5.0));
        REQUIRE(order.total_amount == Approx(105.0));
        REQUIRE(order.status == OrderStatus::Unpaid);
        REQUIRE(order.currency == "USD");
        REQUIRE(order.expires_at == now + 1h);
        REQUIRE(doc.orders.size() == 1);
    }

    SECTION("Fractional amounts") {
        doc.settings.bonus_percentage = 5.0;
        Order order = ledger.quote(doc, quoteFor(1, "42", 50.0), now);
        REQUIRE(order.bonus_amount == Approx(2.5));
        REQUIRE(order.total_amount == Approx(52.5));
    }

    SECTION("Bonus percentage comes from settings") {
        doc.settings.bonus_percentage = 10.0;
        Order order = ledger.quote(doc, quoteFor(1, "42", 200.0), now);
        REQUIRE(order.total_amount == Approx(220.0));
    }

    SECTION("Second quote updates the unpaid order of the same user") {
        Order first = ledger.quote(doc, quoteFor(1, "42", 100.0), now);
        Order second = ledger.quote(doc, quoteFor(1, "42", 300.0), now + 10min);

        REQUIRE(doc.orders.size() == 1);
        REQUIRE(second.id == first.id);
        REQUIRE(second.order_number == first.order_number);
        REQUIRE(second.amount == Approx(300.0));
        REQUIRE(second.total_amount == Approx(315.0));
        REQUIRE(second.expires_at == now + 10min + 1h);
        REQUIRE(second.created_at == now);
    }

    SECTION("Different users get separate orders") {
        ledger.quote(doc, quoteFor(1, "42", 100.0), now);
        ledger.quote(doc, quoteFor(1, "43", 100.0), now);
        REQUIRE(doc.orders.size() == 2);
        REQUIRE(doc.orders[0].order_number != doc.orders[1].order_number);
    }

    SECTION("Booked order is not reused") {
        Order first = ledger.quote(doc, quoteFor(1, "42", 100.0), now);
        ledger.confirm(doc, first.id, now);

        Order second = ledger.quote(doc, quoteFor(1, "42", 80.0), now);
        REQUIRE(second.id != first.id);
        REQUIRE(doc.orders.size() == 2);
    }

    SECTION("Invalid input is rejected without changes") {
        REQUIRE_THROWS_AS(ledger.quote(doc, quoteFor(1, "42", 0.0), now), ValidationError);
        REQUIRE_THROWS_AS(ledger.quote(doc, quoteFor(1, "42", -5.0), now), ValidationError);
        REQUIRE_THROWS_AS(ledger.quote(doc, quoteFor(1, "42", std::nan("")), now), ValidationError);
        REQUIRE_THROWS_AS(ledger.quote(doc, quoteFor(0, "42", 10.0), now), ValidationError);
        REQUIRE_THROWS_AS(ledger.quote(doc, quoteFor(99, "42", 10.0), now), NotFoundError);
        REQUIRE(doc.orders.empty());
    }
}

TEST_CASE("OrderLedger - order codes", "[ledger]") {
    OrderLedger ledger(7);

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string code = ledger.generateOrderCode();
        REQUIRE(code.size() == OrderLedger::kOrderCodeLength);
        for (char c : code) {
            REQUIRE(std::isalnum(static_cast<unsigned char>(c)));
        }
        seen.insert(code);
    }
    REQUIRE(seen.size() == 200);
}

TEST_CASE("OrderLedger - booking", "[ledger]") {
    OrderLedger ledger(42);
    Document doc;
    addProfile(doc, "Anna");
    addProfile(doc, "Maria");
    const Timestamp now = testNow();

    SECTION("Latest unpaid order of the user is booked") {
        ledger.quote(doc, quoteFor(1, "42", 100.0), now);
        ledger.quote(doc, quoteFor(1, "43", 70.0), now);

        auto booked = ledger.book(doc, 1, std::string("42"), now + 5min);
        REQUIRE(booked);
        REQUIRE(booked->telegram_user_id == std::string("42"));
        REQUIRE(booked->status == OrderStatus::Booked);
        REQUIRE(booked->booked_at == now + 5min);
        REQUIRE(doc.orders[1].status == OrderStatus::Unpaid);
    }

    SECTION("Without a user any unpaid order of the profile matches") {
        ledger.quote(doc, quoteFor(1, "42", 100.0), now);
        ledger.quote(doc, quoteFor(1, "43", 70.0), now);

        auto booked = ledger.book(doc, 1, std::nullopt, now);
        REQUIRE(booked);
        REQUIRE(booked->telegram_user_id == std::string("43"));
    }

    SECTION("Nothing to book") {
        ledger.quote(doc, quoteFor(2, "42", 100.0), now);
        REQUIRE_FALSE(ledger.book(doc, 1, std::string("42"), now));
        REQUIRE_FALSE(ledger.book(doc, 2, std::string("43"), now));
        REQUIRE(doc.orders[0].status == OrderStatus::Unpaid);
    }

    SECTION("Confirm by id") {
        Order order = ledger.quote(doc, quoteFor(1, "42", 100.0), now);

        auto confirmed = ledger.confirm(doc, order.id, now + 1min);
        REQUIRE(confirmed);
        REQUIRE(confirmed->status == OrderStatus::Booked);
        REQUIRE(confirmed->booked_at == now + 1min);

        // Повторное подтверждение ничего не меняет
        auto again = ledger.confirm(doc, order.id, now + 2min);
        REQUIRE(again);
        REQUIRE(again->booked_at == now + 1min);

        REQUIRE_FALSE(ledger.confirm(doc, 999, now));
    }
}

TEST_CASE("OrderLedger - expiry sweep", "[ledger]") {
    OrderLedger ledger(42);
    Document doc;
    addProfile(doc, "Anna");
    const Timestamp now = testNow();

    Order order = ledger.quote(doc, quoteFor(1, "42", 100.0), now);

    SECTION("Order survives until the window closes") {
        REQUIRE(ledger.sweep(doc, order.expires_at - 1s) == 0);
        REQUIRE(ledger.sweep(doc, order.expires_at) == 0);
        REQUIRE(doc.orders.size() == 1);
    }

    SECTION("Expired unpaid order is removed") {
        REQUIRE(ledger.sweep(doc, order.expires_at + 1s) == 1);
        REQUIRE(doc.orders.empty());
    }

    SECTION("Booked orders never expire") {
        ledger.confirm(doc, order.id, now);
        REQUIRE(ledger.sweep(doc, now + 48h) == 0);
        REQUIRE(doc.orders.size() == 1);
    }

    SECTION("Refreshed quote extends the window") {
        ledger.quote(doc, quoteFor(1, "42", 120.0), now + 50min);
        REQUIRE(ledger.sweep(doc, now + 1h + 1s) == 0);
        REQUIRE(ledger.sweep(doc, now + 50min + 1h + 1s) == 1);
    }
}

TEST_CASE("OrderLedger - user orders", "[ledger]") {
    OrderLedger ledger(42);
    Document doc;
    addProfile(doc, "Anna");
    addProfile(doc, "Maria");
    const Timestamp now = testNow();

    Order older = ledger.quote(doc, quoteFor(1, "42", 100.0), now);
    Order newer = ledger.quote(doc, quoteFor(2, "42", 200.0), now + 1min);
    ledger.quote(doc, quoteFor(1, "43", 300.0), now);
    ledger.confirm(doc, older.id, now + 2min);

    SECTION("Newest first, only own orders") {
        auto all = ledger.ordersOf(doc, "42", OrderFilter::All);
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == newer.id);
        REQUIRE(all[1].id == older.id);
    }

    SECTION("Status filters") {
        auto booked = ledger.ordersOf(doc, "42", parseOrderFilter("booked"));
        REQUIRE(booked.size() == 1);
        REQUIRE(booked[0].id == older.id);

        auto unpaid = ledger.ordersOf(doc, "42", parseOrderFilter("unpaid"));
        REQUIRE(unpaid.size() == 1);
        REQUIRE(unpaid[0].id == newer.id);

        REQUIRE(parseOrderFilter("whatever") == OrderFilter::All);
    }

    SECTION("Users delete only their own orders") {
        REQUIRE_FALSE(ledger.remove(doc, newer.id, "43"));
        REQUIRE(ledger.remove(doc, newer.id, "42"));
        REQUIRE_FALSE(ledger.remove(doc, newer.id, "42"));
        REQUIRE(ledger.ordersOf(doc, "42", OrderFilter::All).size() == 1);
    }
}
