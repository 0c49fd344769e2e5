#include <catch2/catch.hpp>
#include "recommend/session_cache.hpp"
#include "config.hpp"
#include <atomic>
#include <thread>

using namespace lookbook;

TEST_CASE("SessionCache: resolve by position", "[session_cache]") {
    SessionCache cache(100, 4);
    cache.record("7", {"a", "b", "c"});

    REQUIRE(cache.resolve("7", 1) == std::optional<std::string>("b"));
    REQUIRE(cache.resolve("7", 0) == std::optional<std::string>("a"));
    REQUIRE_FALSE(cache.resolve("7", 5).has_value());
    REQUIRE_FALSE(cache.resolve("7", 3).has_value());
    REQUIRE_FALSE(cache.resolve("7", -1).has_value());
    REQUIRE_FALSE(cache.resolve("8", 0).has_value());
}

TEST_CASE("SessionCache: record overwrites", "[session_cache]") {
    SessionCache cache(100, 4);
    cache.record("u", {"a", "b"});
    cache.record("u", {"z"});

    REQUIRE(cache.resolve("u", 0) == std::optional<std::string>("z"));
    REQUIRE_FALSE(cache.resolve("u", 1).has_value());
    REQUIRE(cache.size() == 1);
}

TEST_CASE("SessionCache: get and erase", "[session_cache]") {
    SessionCache cache(100, 4);
    REQUIRE_FALSE(cache.get("u").has_value());

    cache.record("u", {"a", "b"});
    auto ids = cache.get("u");
    REQUIRE(ids.has_value());
    REQUIRE(ids.value_or(std::vector<std::string>{}) == std::vector<std::string>{"a", "b"});

    REQUIRE(cache.erase("u"));
    REQUIRE_FALSE(cache.erase("u"));
    REQUIRE(cache.size() == 0);
}

TEST_CASE("SessionCache: empty list resolves nothing", "[session_cache]") {
    SessionCache cache(100, 4);
    cache.record("u", {});
    REQUIRE(cache.get("u").has_value());
    REQUIRE_FALSE(cache.resolve("u", 0).has_value());
}

TEST_CASE("SessionCache: bounded with oldest write evicted", "[session_cache]") {
    SessionCache cache(2, 1);
    cache.record("first", {"1"});
    cache.record("second", {"2"});
    cache.record("first", {"1b"});  // refresh "first"
    cache.record("third", {"3"});

    REQUIRE(cache.size() == 2);
    REQUIRE_FALSE(cache.get("second").has_value());
    REQUIRE(cache.resolve("first", 0) == std::optional<std::string>("1b"));
    REQUIRE(cache.resolve("third", 0) == std::optional<std::string>("3"));
}

TEST_CASE("SessionCache: size never exceeds the configured bound", "[session_cache]") {
    SessionCacheConfig cfg;
    cfg.max_entries = 64;
    cfg.shards = 8;
    SessionCache cache(cfg);
    for (int i = 0; i < 1000; ++i) {
        cache.record("user" + std::to_string(i), {"x"});
    }
    REQUIRE(cache.size() <= 64);
    REQUIRE(cache.size() > 0);
}

TEST_CASE("SessionCache: concurrent writers and readers", "[session_cache]") {
    SessionCache cache(10000, 16);
    std::atomic<int> lost{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &lost, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string user = "u" + std::to_string(t) + "_" + std::to_string(i);
                cache.record(user, {user + "_a", user + "_b"});
                auto id = cache.resolve(user, 1);
                if (!id || *id != user + "_b") ++lost;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(lost.load() == 0);
    REQUIRE(cache.size() == 800);
}
