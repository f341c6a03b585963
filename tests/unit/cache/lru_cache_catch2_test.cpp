#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <prompter/cache/lru_cache.h>

#include <algorithm>
#include <list>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using prompter::cache::LRUCache;

TEST_CASE("LRUCache rejects zero capacity", "[cache][lru]") {
    CHECK_THROWS_AS(LRUCache<int>(0), std::invalid_argument);
}

TEST_CASE("LRUCache basic operations", "[cache][lru]") {
    LRUCache<int> cache(3);

    CHECK_FALSE(cache.get("missing").has_value());
    cache.set("a", 1);
    cache.set("b", 2);
    CHECK(cache.size() == 2);
    CHECK(cache.contains("a"));
    CHECK(cache.get("a") == std::optional<int>(1));

    cache.set("a", 10);
    CHECK(cache.size() == 2);
    CHECK(cache.peek("a") == std::optional<int>(10));

    CHECK(cache.erase("a"));
    CHECK_FALSE(cache.erase("a"));
    CHECK_FALSE(cache.contains("a"));
    CHECK(cache.size() == 1);

    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(cache.hitRate() == 0.0);
}

TEST_CASE("LRUCache evicts the least recently used entry", "[cache][lru]") {
    LRUCache<int> cache(3);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);

    SECTION("insertion order breaks ties") {
        cache.set("d", 4);
        CHECK_FALSE(cache.contains("a"));
        CHECK(cache.keys() == std::vector<std::string>{"b", "c", "d"});
    }

    SECTION("get refreshes recency") {
        REQUIRE(cache.get("a").has_value());
        cache.set("d", 4);
        CHECK(cache.contains("a"));
        CHECK_FALSE(cache.contains("b"));
    }

    SECTION("set on an existing key refreshes recency") {
        cache.set("a", 100);
        cache.set("d", 4);
        CHECK(cache.contains("a"));
        CHECK_FALSE(cache.contains("b"));
    }

    SECTION("peek does not refresh recency") {
        REQUIRE(cache.peek("a").has_value());
        cache.set("d", 4);
        CHECK_FALSE(cache.contains("a"));
    }

    CHECK(cache.size() == 3);
}

TEST_CASE("LRUCache matches a reference model", "[cache][lru][property]") {
    const size_t capacity = GENERATE(1, 2, 5, 16);
    LRUCache<int> cache(capacity);
    std::list<std::string> model; // front is most recently used

    std::mt19937 rng(static_cast<unsigned>(capacity) * 7919u);
    std::uniform_int_distribution<int> keyDist(0, static_cast<int>(capacity) * 3);
    std::uniform_int_distribution<int> opDist(0, 2);

    auto touch = [&](const std::string& key) {
        model.remove(key);
        model.push_front(key);
    };

    for (int step = 0; step < 500; ++step) {
        auto key = "k" + std::to_string(keyDist(rng));
        bool present = std::find(model.begin(), model.end(), key) != model.end();
        switch (opDist(rng)) {
            case 0: {
                auto got = cache.get(key);
                REQUIRE(got.has_value() == present);
                if (present) {
                    touch(key);
                }
                break;
            }
            case 1:
            case 2: {
                std::optional<std::string> expectedVictim;
                if (!present && model.size() == capacity) {
                    expectedVictim = model.back();
                    model.pop_back();
                }
                cache.set(key, step);
                touch(key);
                if (expectedVictim) {
                    REQUIRE_FALSE(cache.contains(*expectedVictim));
                }
                break;
            }
        }
        REQUIRE(cache.size() <= capacity);
        REQUIRE(cache.size() == model.size());
    }

    std::vector<std::string> expected(model.rbegin(), model.rend());
    CHECK(cache.keys() == expected);
}

TEST_CASE("LRUCache statistics", "[cache][lru]") {
    LRUCache<std::string> cache(2, [](const std::string& v) { return v.size(); });
    cache.set("a", "xxxx");
    cache.set("b", "yy");

    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("b");
    (void)cache.get("zz");

    auto stats = cache.getStats();
    CHECK(stats.size == 2);
    CHECK(stats.capacity == 2);
    CHECK(stats.hits == 3);
    CHECK(stats.misses == 1);
    CHECK(stats.hitRate == 75.0);
    REQUIRE(stats.oldestEntry.has_value());
    REQUIRE(stats.newestEntry.has_value());
    CHECK(*stats.oldestEntry <= *stats.newestEntry);

    cache.set("c", "z");
    CHECK(cache.getStats().evictions == 1);

    auto usage = cache.estimateMemoryUsage();
    CHECK(usage >= std::string("yy").size() + std::string("z").size());

    cache.resetStats();
    CHECK(cache.hitRate() == 0.0);
    CHECK(cache.size() == 2);
}

TEST_CASE("LRUCache age-based eviction", "[cache][lru]") {
    LRUCache<int> cache(10);
    cache.set("old1", 1);
    cache.set("old2", 2);
    std::this_thread::sleep_for(60ms);
    cache.set("fresh", 3);
    (void)cache.get("old2");

    CHECK(cache.evictOlderThan(30ms) == 1);
    CHECK_FALSE(cache.contains("old1"));
    CHECK(cache.contains("old2"));
    CHECK(cache.contains("fresh"));
    CHECK(cache.evictOlderThan(10s) == 0);
}

TEST_CASE("LRUCache enumerates least recently used first", "[cache][lru]") {
    LRUCache<int> cache(4);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    (void)cache.get("a");

    CHECK(cache.leastRecentlyUsed(2) == std::vector<std::string>{"b", "c"});
    CHECK(cache.values() == std::vector<int>{2, 3, 1});
}
