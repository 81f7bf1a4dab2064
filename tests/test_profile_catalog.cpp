#include <catch2/catch.hpp>

#include "db/store_errors.h"
#include "domain/profile_catalog.h"
#include "test_support.h"

using namespace std::chrono_literals;

static ProfileDraft draftOf(const std::string& name, const std::string& city, int age) {
    ProfileDraft d;
    d.name = name;
    d.city = city;
    d.age = age;
    d.gender = "female";
    d.nationality = "French";
    d.travel_cities = {"Rome", "Berlin"};
    d.height = 170;
    return d;
}

TEST_CASE("ProfileCatalog - create and search", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    catalog.create(doc, draftOf("Anna", "Paris", 23), now);
    catalog.create(doc, draftOf("Maria", "Lyon", 31), now);
    Profile hidden = catalog.create(doc, draftOf("Olga", "paris", 27), now);
    catalog.setVisible(doc, hidden.id, false);

    SECTION("Only visible profiles are listed") {
        REQUIRE(catalog.visible(doc).size() == 2);
        REQUIRE(catalog.search(doc, ProfileFilter{}).total == 2);
    }

    SECTION("Filters ignore case") {
        ProfileFilter f;
        f.city = "PARIS";
        auto page = catalog.search(doc, f);
        REQUIRE(page.total == 1);
        REQUIRE(page.profiles[0].name == "Anna");

        f = ProfileFilter{};
        f.travel_city = "rome";
        REQUIRE(catalog.search(doc, f).total == 2);

        f.city = "all";
        f.age_min = 30;
        REQUIRE(catalog.search(doc, f).profiles[0].name == "Maria");
    }

    SECTION("Pagination") {
        for (int i = 0; i < 20; ++i) {
            catalog.create(doc, draftOf("P" + std::to_string(i), "Nice", 25), now);
        }
        ProfileFilter f;
        f.limit = 12;
        auto first = catalog.search(doc, f);
        REQUIRE(first.profiles.size() == 12);
        REQUIRE(first.has_more);
        REQUIRE(first.total == 22);

        f.page = 1;
        auto second = catalog.search(doc, f);
        REQUIRE(second.profiles.size() == 10);
        REQUIRE_FALSE(second.has_more);
    }

    SECTION("Validation") {
        REQUIRE_THROWS_AS(catalog.create(doc, draftOf("", "Paris", 20), now), ValidationError);
        REQUIRE_THROWS_AS(catalog.create(doc, draftOf("Eva", "Paris", -1), now), ValidationError);
        REQUIRE(doc.profiles.size() == 3);
    }
}

TEST_CASE("ProfileCatalog - cascade delete", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    Profile anna = catalog.create(doc, draftOf("Anna", "Paris", 23), now);
    Profile maria = catalog.create(doc, draftOf("Maria", "Lyon", 31), now);

    Chat a = chats.findOrCreate(doc, anna.id, std::string("42"), now);
    Chat m = chats.findOrCreate(doc, maria.id, std::string("42"), now);
    chats.appendSystemMessage(doc, a.id, "hello", now);
    chats.appendSystemMessage(doc, m.id, "hello", now);
    catalog.addAdminComment(doc, anna.id, "Guest", "Great", now);
    catalog.addAdminComment(doc, maria.id, "Guest", "Nice", now);

    QuoteRequest q;
    q.profile_id = anna.id;
    q.telegram_user_id = std::string("42");
    q.amount = 50.0;
    ledger.quote(doc, q, now);

    REQUIRE(catalog.remove(doc, anna.id));
    REQUIRE(doc.profiles.size() == 1);
    REQUIRE(doc.chats.size() == 1);
    REQUIRE(doc.chats[0].id == m.id);
    REQUIRE(doc.messages.size() == 1);
    REQUIRE(doc.comments.size() == 1);
    REQUIRE(doc.comments[0].profile_id == maria.id);
    REQUIRE(doc.orders.size() == 1);

    REQUIRE_FALSE(catalog.remove(doc, anna.id));
}

TEST_CASE("ProfileCatalog - ids after removal", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    catalog.create(doc, draftOf("Anna", "Paris", 23), now);
    Profile maria = catalog.create(doc, draftOf("Maria", "Lyon", 31), now);
    Chat maria_chat = chats.findOrCreate(doc, maria.id, std::string("42"), now);
    Comment maria_comment = catalog.addAdminComment(doc, maria.id, "Guest", "Nice", now);

    QuoteRequest q;
    q.profile_id = maria.id;
    q.telegram_user_id = std::string("42");
    q.amount = 100.0;
    Order old_order = ledger.quote(doc, q, now);

    REQUIRE(catalog.remove(doc, maria.id));

    SECTION("Highest profile id is not handed out again") {
        Profile sofia = catalog.create(doc, draftOf("Sofia", "Nice", 25), now);
        REQUIRE(sofia.id > maria.id);

        Chat chat = chats.findOrCreate(doc, sofia.id, std::string("42"), now);
        REQUIRE(chat.id > maria_chat.id);

        Comment c = catalog.addAdminComment(doc, sofia.id, "Guest", "Hi", now);
        REQUIRE(c.id > maria_comment.id);
    }

    SECTION("New profile does not inherit orders of the removed one") {
        Profile sofia = catalog.create(doc, draftOf("Sofia", "Nice", 25), now);

        q.profile_id = sofia.id;
        q.amount = 200.0;
        Order fresh = ledger.quote(doc, q, now + std::chrono::minutes(5));

        REQUIRE(fresh.id != old_order.id);
        REQUIRE(doc.orders.size() == 2);
        REQUIRE(doc.orders[0].profile_id == maria.id);
        REQUIRE(doc.orders[0].amount == Approx(100.0));
        REQUIRE(ledger.book(doc, sofia.id, std::string("42"), now)->id == fresh.id);
    }
}

TEST_CASE("ProfileCatalog - filter values", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    ProfileDraft anna = draftOf("Anna", "Paris", 23);
    ProfileDraft maria = draftOf("Maria", "Lyon", 31);
    maria.nationality = "Italian";
    maria.travel_cities = {"Milan", "Rome"};
    ProfileDraft olga = draftOf("Olga", "Kazan", 27);
    olga.nationality = "Russian";
    olga.travel_cities = {"Sochi"};
    ProfileDraft nameless = draftOf("Nina", "", 29);
    nameless.nationality = "";

    catalog.create(doc, anna, now);
    catalog.create(doc, maria, now);
    catalog.create(doc, nameless, now);
    Profile hidden = catalog.create(doc, olga, now);
    catalog.setVisible(doc, hidden.id, false);

    CatalogFacets f = catalog.facets(doc);
    REQUIRE((f.cities == std::vector<std::string>{"Lyon", "Paris"}));
    REQUIRE((f.nationalities == std::vector<std::string>{"French", "Italian"}));
    REQUIRE((f.travel_cities == std::vector<std::string>{"Berlin", "Milan", "Rome"}));
    REQUIRE((ProfileCatalog::genders() == std::vector<std::string>{"male", "female", "transgender"}));
}

TEST_CASE("ProfileCatalog - VIP previews", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc = defaultDocument();
    const Timestamp now = testNow();

    SECTION("Create, list and remove") {
        VipProfileDraft d;
        d.name = "Secret";
        d.age = 22;
        d.city = "Paris";
        d.gender = "";
        d.photos = {"/uploads/s1.jpg", "/uploads/s2.jpg"};

        VipProfile first = catalog.addVipProfile(doc, d, now);
        REQUIRE(first.gender == "female");
        REQUIRE(first.photos.size() == 2);

        d.name = "Hidden";
        VipProfile second = catalog.addVipProfile(doc, d, now);
        REQUIRE(catalog.vipProfiles(doc).size() == 2);

        REQUIRE(catalog.removeVipProfile(doc, second.id));
        REQUIRE_FALSE(catalog.removeVipProfile(doc, second.id));
        REQUIRE(catalog.vipProfiles(doc).size() == 1);

        VipProfile third = catalog.addVipProfile(doc, d, now);
        REQUIRE(third.id > second.id);
    }

    SECTION("Photo and name are required") {
        REQUIRE_THROWS_AS(catalog.addVipProfile(doc, VipProfileDraft{"Secret", 22, "Paris", "female", {}}, now),
                          ValidationError);
        REQUIRE_THROWS_AS(catalog.addVipProfile(doc, VipProfileDraft{"", 22, "Paris", "female", {"/a.jpg"}}, now),
                          ValidationError);
        REQUIRE(doc.vip_profiles.empty());
    }

    SECTION("Catalog metadata is replaced as a whole") {
        REQUIRE(catalog.vipCatalogs(doc).contains("vip"));
        REQUIRE(catalog.vipCatalogs(doc)["secret"]["price"] == 2499);

        nlohmann::json catalogs = {
            {"vip", {{"name", "VIP"}, {"price", 299}, {"visible", false}}}
        };
        catalog.setVipCatalogs(doc, catalogs);
        REQUIRE(catalog.vipCatalogs(doc) == catalogs);

        REQUIRE_THROWS_AS(catalog.setVipCatalogs(doc, nlohmann::json::array()), ValidationError);
        REQUIRE_THROWS_AS(catalog.setVipCatalogs(doc, nlohmann::json{{"vip", 5}}), ValidationError);
        REQUIRE(catalog.vipCatalogs(doc) == catalogs);
    }
}

TEST_CASE("ProfileCatalog - comments", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    Profile anna = catalog.create(doc, draftOf("Anna", "Paris", 23), now);
    CommentAuthor author{"42", "johnny", "John"};

    SECTION("Without a completed transaction commenting is forbidden") {
        REQUIRE_THROWS_AS(catalog.addUserComment(doc, anna.id, author, "Great", now), ForbiddenError);

        chats.findOrCreate(doc, anna.id, std::string("42"), now);
        REQUIRE_THROWS_AS(catalog.addUserComment(doc, anna.id, author, "Great", now), ForbiddenError);
        REQUIRE(doc.comments.empty());
    }

    SECTION("After payment the comment carries the promo code") {
        QuoteRequest q;
        q.profile_id = anna.id;
        q.telegram_user_id = std::string("42");
        q.amount = 50.0;
        Order order = ledger.quote(doc, q, now);
        doc.orders[0].promo_code = std::string("WELCOME15");
        chats.confirmOrder(doc, order.id, now);

        Comment c = catalog.addUserComment(doc, anna.id, author, "Great", now);
        REQUIRE(c.user_name == "johnny");
        REQUIRE(c.telegram_username == "johnny");
        REQUIRE(c.promo_code == std::string("WELCOME15"));
        REQUIRE(catalog.commentsOf(doc, anna.id).size() == 1);
    }

    SECTION("Name falls back to first name, then Anonymous") {
        Chat chat = chats.findOrCreate(doc, anna.id, std::string("42"), now);
        chats.appendSystemMessage(doc, chat.id, ChatRegistry::kConfirmationText, now);

        Comment c = catalog.addUserComment(doc, anna.id, CommentAuthor{"42", "", "John"}, "ok", now);
        REQUIRE(c.user_name == "John");
        REQUIRE_FALSE(c.promo_code);

        Comment anon = catalog.addUserComment(doc, anna.id, CommentAuthor{"42", "", ""}, "ok", now);
        REQUIRE(anon.user_name == "Anonymous");
    }

    SECTION("Admin comments and removal") {
        Comment c = catalog.addAdminComment(doc, anna.id, "Guest", "Lovely", now);
        REQUIRE_THROWS_AS(catalog.addAdminComment(doc, 99, "Guest", "Lovely", now), NotFoundError);

        REQUIRE_FALSE(catalog.removeComment(doc, 99, c.id));
        REQUIRE(catalog.removeComment(doc, anna.id, c.id));
        REQUIRE(doc.comments.empty());
    }

    SECTION("Unknown profile") {
        REQUIRE_THROWS_AS(catalog.addUserComment(doc, 99, author, "Great", now), NotFoundError);
    }
}

TEST_CASE("ProfileCatalog - stats", "[catalog]") {
    OrderLedger ledger(1);
    ChatRegistry chats(ledger);
    ProfileCatalog catalog(chats);
    Document doc;
    const Timestamp now = testNow();

    Profile anna = catalog.create(doc, draftOf("Anna", "Paris", 23), now);
    Chat chat = chats.findOrCreate(doc, anna.id, std::string("42"), now);
    MessageDraft d;
    d.sender = Sender::User;
    d.text = "hi";
    chats.appendMessage(doc, chat.id, d, now);
    chats.appendSystemMessage(doc, chat.id, "note", now);

    catalog.addVipProfile(doc, VipProfileDraft{"Secret", 22, "Paris", "female", {"/uploads/v.jpg"}}, now);

    CatalogStats s = catalog.stats(doc);
    REQUIRE(s.profiles == 1);
    REQUIRE(s.vip_profiles == 1);
    REQUIRE(s.chats == 1);
    REQUIRE(s.messages == 2);
    REQUIRE(s.unread_messages == 1);
}
