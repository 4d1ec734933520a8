#include "doctest/doctest.h"

#include <string>

#include "utils/lru_cache.hpp"

using captionist::utils::LruCache;

TEST_CASE("LRU cache evicts the least recently used entry") {
    LruCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    REQUIRE(cache.get("a") == 1);

    cache.put("c", 3);
    CHECK(cache.contains("a"));
    CHECK_FALSE(cache.contains("b"));
    CHECK(cache.contains("c"));
    CHECK(cache.size() == 2);
}

TEST_CASE("get_or_compute only computes on a miss") {
    LruCache<int, int> cache(4);
    int computed = 0;
    auto square = [&](int v) {
        return cache.get_or_compute(v, [&]() {
            ++computed;
            return v * v;
        });
    };
    CHECK(square(3) == 9);
    CHECK(square(3) == 9);
    CHECK(computed == 1);
}

TEST_CASE("copied caches are independent") {
    LruCache<int, int> cache(2);
    cache.put(1, 10);
    LruCache<int, int> copy = cache;
    copy.put(2, 20);
    copy.put(3, 30);

    CHECK(cache.contains(1));
    CHECK_FALSE(copy.contains(1));
    CHECK(copy.get(3) == 30);
}
