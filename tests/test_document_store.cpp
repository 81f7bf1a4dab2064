#include <catch2/catch.hpp>

#include <chrono>

#include "db/document_store.h"
#include "domain/document_json.h"
#include "test_support.h"

using namespace std::chrono_literals;

TEST_CASE("DocumentStore - missing file", "[store]") {
    TempDir dir;
    DocumentStore store(dir.file("data.json"));

    Document doc = store.load();
    REQUIRE(doc.version == 0);
    REQUIRE(doc.profiles.empty());
    REQUIRE(doc.settings.crypto_wallets.count("trc20") == 1);
    REQUIRE(doc.settings.bonus_percentage == Approx(5.0));
}

TEST_CASE("DocumentStore - save and reload", "[store]") {
    TempDir dir;
    const std::string path = dir.file("data.json");

    SECTION("Version grows with every save") {
        DocumentStore store(path);
        Document doc = store.load();
        addProfile(doc, "Anna");
        store.save(doc);
        REQUIRE(doc.version == 1);

        store.save(doc);
        REQUIRE(doc.version == 2);
    }

    SECTION("Cached copy matches what was written") {
        DocumentStore store(path);
        Document doc = store.load();
        addProfile(doc, "Anna");
        store.save(doc);

        Document cached = store.load();
        REQUIRE(cached.version == 1);
        REQUIRE(cached.profiles.size() == 1);
        REQUIRE(cached.profiles[0].name == "Anna");
    }

    SECTION("Another store on the same file sees the write") {
        DocumentStore writer(path);
        DocumentStore reader(path, 0ms);

        Document doc = writer.load();
        addProfile(doc, "Anna");
        writer.save(doc);

        Document seen = reader.load();
        REQUIRE(seen.version == 1);
        REQUIRE(seen.profiles.size() == 1);
    }

    SECTION("Written file is valid JSON with the version") {
        DocumentStore store(path);
        Document doc = store.load();
        store.save(doc);

        auto j = nlohmann::json::parse(readFile(path));
        REQUIRE(j["version"] == 1);
        REQUIRE(j.contains("settings"));
    }
}

TEST_CASE("DocumentStore - crash leftovers and corruption", "[store]") {
    TempDir dir;
    const std::string path = dir.file("data.json");

    SECTION("Half-written temp file does not affect the document") {
        {
            DocumentStore store(path);
            Document doc = store.load();
            addProfile(doc, "Anna");
            store.save(doc);
        }
        // Процесс упал посреди записи: остался обрезанный .tmp
        writeFile(path + ".tmp", "{\"version\": 2, \"profiles\": [{\"id\": 1, \"na");

        DocumentStore store(path);
        Document doc = store.load();
        REQUIRE(doc.version == 1);
        REQUIRE(doc.profiles.size() == 1);
        REQUIRE(doc.profiles[0].name == "Anna");

        addProfile(doc, "Maria");
        store.save(doc);
        REQUIRE(DocumentStore(path, 0ms).load().profiles.size() == 2);
    }

    SECTION("Corrupt file reads as an empty document") {
        writeFile(path, "{not json at all");

        DocumentStore store(path);
        Document doc = store.load();
        REQUIRE(doc.version == 0);
        REQUIRE(doc.profiles.empty());

        addProfile(doc, "Anna");
        store.save(doc);
        REQUIRE(doc.version == 1);
        REQUIRE(nlohmann::json::parse(readFile(path))["profiles"].size() == 1);
    }

    SECTION("Unknown top-level sections survive a save") {
        writeFile(path, R"({
            "version": 3,
            "profiles": [],
            "legacy_stats": [{"id": 1, "name": "Secret"}],
            "promocodes": [],
            "custom_section": {"flag": true}
        })");

        DocumentStore store(path);
        Document doc = store.load();
        REQUIRE(doc.version == 3);
        addProfile(doc, "Anna");
        store.save(doc);

        auto j = nlohmann::json::parse(readFile(path));
        REQUIRE(j["version"] == 4);
        REQUIRE(j["legacy_stats"].size() == 1);
        REQUIRE(j["legacy_stats"][0]["name"] == "Secret");
        REQUIRE(j["custom_section"]["flag"] == true);
    }
}

TEST_CASE("DocumentStore - id counters", "[store]") {
    TempDir dir;
    const std::string path = dir.file("data.json");

    SECTION("Counters survive removal and reload") {
        DocumentStore store(path, 0ms);
        store.update([](Document& doc) {
            addProfile(doc, "Anna");
            addProfile(doc, "Maria");
        });
        store.update([](Document& doc) { doc.profiles.pop_back(); });

        Document doc = store.load();
        REQUIRE(doc.counters.profiles == 2);
        REQUIRE(nlohmann::json::parse(readFile(path))["counters"]["profiles"] == 2);

        REQUIRE(addProfile(doc, "Sofia").id == 3);
    }

    SECTION("File without counters is back-filled from the highest ids") {
        writeFile(path, R"({
            "version": 1,
            "profiles": [{"id": 4, "name": "Anna"}],
            "chats": [{"id": 7, "profile_id": 4}],
            "messages": [{"id": 30, "chat_id": 7, "is_from_user": true}],
            "orders": [{"id": "12", "profile_id": 4, "status": "booked"}]
        })");

        Document doc = DocumentStore(path).load();
        REQUIRE(doc.counters.profiles == 4);
        REQUIRE(doc.counters.chats == 7);
        REQUIRE(doc.counters.messages == 30);
        REQUIRE(doc.counters.orders == 12);
        REQUIRE(doc.counters.comments == 0);
    }

    SECTION("Stored counter above the highest id wins") {
        writeFile(path, R"({
            "version": 1,
            "counters": {"messages": 50},
            "messages": [{"id": 30, "chat_id": 7, "is_from_user": true}]
        })");

        Document doc = DocumentStore(path).load();
        REQUIRE(doc.counters.messages == 50);
        REQUIRE(nextId(doc.counters.messages, doc.messages) == 51);
    }
}

TEST_CASE("DocumentStore - optimistic versioning", "[store]") {
    TempDir dir;
    const std::string path = dir.file("data.json");
    DocumentStore first(path, 0ms);
    DocumentStore second(path, 0ms);

    SECTION("Saving a stale copy is rejected") {
        Document a = first.load();
        Document b = second.load();

        addProfile(a, "Anna");
        first.save(a);

        addProfile(b, "Maria");
        REQUIRE_THROWS_AS(second.save(b), StaleWriteError);
        REQUIRE(b.version == 0);

        Document on_disk = first.load();
        REQUIRE(on_disk.profiles.size() == 1);
        REQUIRE(on_disk.profiles[0].name == "Anna");
    }

    SECTION("update retries once on a fresh document") {
        int calls = 0;
        second.update([&](Document& doc) {
            if (++calls == 1) {
                first.update([](Document& other) { addProfile(other, "Anna"); });
            }
            addProfile(doc, "Maria");
        });

        REQUIRE(calls == 2);
        Document doc = first.load();
        REQUIRE(doc.version == 2);
        REQUIRE(doc.profiles.size() == 2);
        REQUIRE(doc.profiles[0].name == "Anna");
        REQUIRE(doc.profiles[1].name == "Maria");
    }

    SECTION("update gives up after the retry also conflicts") {
        int calls = 0;
        REQUIRE_THROWS_AS(second.update([&](Document& doc) {
            ++calls;
            first.update([](Document& other) { addProfile(other, "Anna"); });
            addProfile(doc, "Maria");
        }), ConflictError);

        REQUIRE(calls == 2);
        Document doc = first.load();
        REQUIRE(doc.profiles.size() == 2);
        REQUIRE(doc.profiles[0].name == "Anna");
        REQUIRE(doc.profiles[1].name == "Anna");
    }

    SECTION("tryUpdate without changes does not write") {
        bool changed = first.tryUpdate([](Document&) { return false; });
        REQUIRE_FALSE(changed);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("Exceptions from the mutation leave the file untouched") {
        first.update([](Document& doc) { addProfile(doc, "Anna"); });
        REQUIRE_THROWS_AS(first.update([](Document& doc) {
            addProfile(doc, "Maria");
            throw NotFoundError("chat 7 not found");
        }), NotFoundError);

        Document doc = second.load();
        REQUIRE(doc.version == 1);
        REQUIRE(doc.profiles.size() == 1);
    }
}
