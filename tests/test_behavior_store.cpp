#include <catch2/catch.hpp>
#include "behavior/sqlite_behavior_store.hpp"
#include <filesystem>
#include <unistd.h>

using namespace lookbook;

static std::string behavior_test_path() {
    return "/tmp/lookbook_test_behavior_" + std::to_string(getpid()) + ".db";
}

struct BehaviorFixture {
    std::string path = behavior_test_path();
    SqliteBehaviorStore store{path, 20};

    ~BehaviorFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

// ── Type names ───────────────────────────────────────────────

TEST_CASE("BehaviorType: string round trip", "[behavior]") {
    REQUIRE(behavior_type_to_string(BehaviorType::Search) == "search");
    REQUIRE(behavior_type_to_string(BehaviorType::Click) == "click");
    REQUIRE(behavior_type_from_string("click") == BehaviorType::Click);
    REQUIRE_FALSE(behavior_type_from_string("purchase").has_value());
}

// ── add ──────────────────────────────────────────────────────

TEST_CASE("SqliteBehaviorStore: add returns increasing ids", "[behavior]") {
    BehaviorFixture f;
    auto a = f.store.add("u1", BehaviorType::Search, "red dress", 100);
    auto b = f.store.add("u1", BehaviorType::Click, "/img/1.jpg", 100);
    REQUIRE(a > 0);
    REQUIRE(b > a);
    REQUIRE(f.store.count("u1", std::nullopt) == 2);
}

TEST_CASE("SqliteBehaviorStore: values are trimmed and blanks ignored", "[behavior]") {
    BehaviorFixture f;
    REQUIRE(f.store.add("u1", BehaviorType::Search, "   ", 100) == 0);
    REQUIRE(f.store.add("u1", BehaviorType::Search, "", 100) == 0);
    f.store.add("u1", BehaviorType::Search, "  boots \n", 100);

    auto events = f.store.recent("u1", BehaviorType::Search, 10);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].value == "boots");
}

TEST_CASE("SqliteBehaviorStore: add without timestamp uses now", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "now");
    auto events = f.store.recent("u1", BehaviorType::Search, 1);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].timestamp > 1600000000);
}

// ── recent / history ─────────────────────────────────────────

TEST_CASE("SqliteBehaviorStore: recent is newest first per type", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "old", 100);
    f.store.add("u1", BehaviorType::Search, "new", 300);
    f.store.add("u1", BehaviorType::Search, "mid", 200);
    f.store.add("u1", BehaviorType::Click, "/img/x.jpg", 400);

    auto events = f.store.recent("u1", BehaviorType::Search, 10);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].value == "new");
    REQUIRE(events[1].value == "mid");
    REQUIRE(events[2].value == "old");
    REQUIRE(events[0].user_id == "u1");
    REQUIRE(events[0].type == BehaviorType::Search);
}

TEST_CASE("SqliteBehaviorStore: equal timestamps fall back to insert order", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "first", 100);
    f.store.add("u1", BehaviorType::Search, "second", 100);

    auto events = f.store.recent("u1", BehaviorType::Search, 10);
    REQUIRE(events[0].value == "second");
    REQUIRE(events[1].value == "first");
}

TEST_CASE("SqliteBehaviorStore: users are isolated", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "mine", 100);
    f.store.add("u2", BehaviorType::Search, "theirs", 100);

    REQUIRE(f.store.history("u1", 10).size() == 1);
    REQUIRE(f.store.history("u1", 10)[0].value == "mine");
    REQUIRE(f.store.count("u3", std::nullopt) == 0);
}

TEST_CASE("SqliteBehaviorStore: history mixes types", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "s1", 100);
    f.store.add("u1", BehaviorType::Click, "c1", 200);
    f.store.add("u1", BehaviorType::Search, "s2", 300);

    auto events = f.store.history("u1", 2);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].value == "s2");
    REQUIRE(events[1].value == "c1");
    REQUIRE(f.store.history("u1", 0).empty());
}

TEST_CASE("SqliteBehaviorStore: each type keeps its newest events", "[behavior]") {
    std::string path = behavior_test_path() + ".cap";
    {
        SqliteBehaviorStore store(path, 3);
        for (int i = 0; i < 5; ++i) {
            store.add("u1", BehaviorType::Search, "q" + std::to_string(i),
                      static_cast<uint64_t>(100 + i));
        }
        store.add("u1", BehaviorType::Click, "c0", 50);

        REQUIRE(store.count("u1", BehaviorType::Search) == 3);
        REQUIRE(store.count("u1", BehaviorType::Click) == 1);
        auto events = store.recent("u1", BehaviorType::Search, 10);
        REQUIRE(events.front().value == "q4");
        REQUIRE(events.back().value == "q2");
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

// ── get_recent_mixed ─────────────────────────────────────────

TEST_CASE("get_recent_mixed: newer search outranks older click", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Click, "/img/old.jpg", 100);
    f.store.add("u1", BehaviorType::Search, "newer query", 200);

    auto events = f.store.get_recent_mixed("u1", 2);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].type == BehaviorType::Search);
    REQUIRE(events[0].value == "newer query");
    REQUIRE(events[1].type == BehaviorType::Click);
}

TEST_CASE("get_recent_mixed: truncated to limit across types", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "s1", 100);
    f.store.add("u1", BehaviorType::Search, "s2", 110);
    f.store.add("u1", BehaviorType::Click, "c1", 120);
    f.store.add("u1", BehaviorType::Search, "s3", 130);
    f.store.add("u1", BehaviorType::Click, "c2", 90);

    auto events = f.store.get_recent_mixed("u1", 3);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].value == "s3");
    REQUIRE(events[1].value == "c1");
    REQUIRE(events[2].value == "s2");
    REQUIRE(f.store.get_recent_mixed("u1", 0).empty());
    REQUIRE(f.store.get_recent_mixed("nobody", 3).empty());
}

// ── delete_all ───────────────────────────────────────────────

TEST_CASE("SqliteBehaviorStore: delete_all removes only that user", "[behavior]") {
    BehaviorFixture f;
    f.store.add("u1", BehaviorType::Search, "a", 100);
    f.store.add("u1", BehaviorType::Click, "b", 100);
    f.store.add("u2", BehaviorType::Search, "c", 100);

    REQUIRE(f.store.delete_all("u1") == 2);
    REQUIRE(f.store.count("u1", std::nullopt) == 0);
    REQUIRE(f.store.count("u2", std::nullopt) == 1);
    REQUIRE(f.store.delete_all("u1") == 0);
}

TEST_CASE("SqliteBehaviorStore: events survive reopening", "[behavior]") {
    std::string path = behavior_test_path() + ".reopen";
    {
        SqliteBehaviorStore store(path, 20);
        store.add("u1", BehaviorType::Search, "persisted", 100);
    }
    {
        SqliteBehaviorStore store(path, 20);
        auto events = store.history("u1", 10);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].value == "persisted");
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

TEST_CASE("SqliteBehaviorStore: unopenable path throws", "[behavior]") {
    REQUIRE_THROWS_AS(SqliteBehaviorStore("/proc/lookbook/denied/behavior.db", 20),
                      std::exception);
}
