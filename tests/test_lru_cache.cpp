#include <catch2/catch_test_macros.hpp>
#include "chunkfetch/lru_cache.hpp"
#include <set>
#include <string>

using namespace chunkfetch;

TEST_CASE("LRUCache basic operations", "[lru]") {
    LRUCache<std::string, int> cache(100);

    SECTION("Put and get") {
        cache.put("key1", 42);

        auto* val = cache.get("key1");
        REQUIRE(val != nullptr);
        REQUIRE(*val == 42);
    }

    SECTION("Missing key returns nullptr") {
        REQUIRE(cache.get("nonexistent") == nullptr);
        REQUIRE(cache.stats().misses == 1);
    }

    SECTION("Update existing key") {
        cache.put("key1", 1);
        cache.put("key1", 2);

        REQUIRE(cache.size() == 1);
        REQUIRE(*cache.get("key1") == 2);
    }

    SECTION("Remove key") {
        cache.put("key1", 42);
        REQUIRE(cache.remove("key1"));
        REQUIRE(cache.get("key1") == nullptr);
        REQUIRE(!cache.remove("key1"));
    }

    SECTION("Conditional remove") {
        cache.put("key1", 42);
        REQUIRE(!cache.remove_if("key1", [](int v) { return v == 7; }));
        REQUIRE(cache.contains("key1"));
        REQUIRE(cache.remove_if("key1", [](int v) { return v == 42; }));
        REQUIRE(!cache.contains("key1"));
    }
}

TEST_CASE("LRUCache eviction order", "[lru]") {
    LRUCache<int, int> cache(3);
    cache.put(1, 1);
    cache.put(2, 2);
    cache.put(3, 3);

    SECTION("Least recently inserted goes first") {
        auto evicted = cache.put(4, 4);
        REQUIRE(evicted.size() == 1);
        REQUIRE(evicted[0].first == 1);
        REQUIRE(cache.size() == 3);
    }

    SECTION("get promotes") {
        cache.get(1);
        auto evicted = cache.put(4, 4);
        REQUIRE(evicted.size() == 1);
        REQUIRE(evicted[0].first == 2);
        REQUIRE(cache.contains(1));
    }

    SECTION("peek does not promote") {
        REQUIRE(cache.peek(1) != nullptr);
        auto evicted = cache.put(4, 4);
        REQUIRE(evicted[0].first == 1);
    }

    SECTION("Iteration runs most recent first") {
        std::vector<int> keys;
        cache.for_each([&](int k, int) { keys.push_back(k); });
        REQUIRE(keys == std::vector<int>{3, 2, 1});
    }
}

TEST_CASE("LRUCache pinned entries", "[lru]") {
    std::set<int> pinned;
    LRUCache<int, int> cache(2, [&pinned](const int& k, const int&) {
        return pinned.count(k) == 0;
    });

    SECTION("Pinned entry is skipped") {
        cache.put(1, 1);
        cache.put(2, 2);
        pinned.insert(1);

        auto evicted = cache.put(3, 3);
        REQUIRE(evicted.size() == 1);
        REQUIRE(evicted[0].first == 2);
        REQUIRE(cache.contains(1));
        REQUIRE(cache.stats().pinned_skips >= 1);
    }

    SECTION("Grows past capacity when everything is pinned") {
        cache.put(1, 1);
        cache.put(2, 2);
        pinned = {1, 2};

        auto evicted = cache.put(3, 3);
        REQUIRE(evicted.empty());
        REQUIRE(cache.size() == 3);
        REQUIRE(cache.over_capacity());

        // Unpinning lets the next insert shrink back
        pinned.clear();
        evicted = cache.put(4, 4);
        REQUIRE(evicted.size() == 2);
        REQUIRE(cache.size() == 2);
        REQUIRE(!cache.over_capacity());
    }
}
