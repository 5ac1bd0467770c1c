#include <catch2/catch_test_macros.hpp>
#include <trekanten/resource/cached_storage.h>

#include <stdexcept>
#include <string>

using namespace trekanten;

TEST_CASE("Cached storage", "[resource][cached_storage]") {
    CachedStorage<std::string, size_t> storage;
    int calls = 0;
    auto factory = [&calls](const std::string& s) {
        ++calls;
        return s.size();
    };

    SECTION("Equal descriptors share a handle") {
        auto a = storage.CreateOrAdd("abc", factory);
        auto b = storage.CreateOrAdd("abc", factory);

        REQUIRE(a == b);
        REQUIRE(calls == 1);
        REQUIRE(storage.Size() == 1);
        REQUIRE(*storage.Get(a) == 3);
    }

    SECTION("Different descriptors get different handles") {
        auto a = storage.CreateOrAdd("abc", factory);
        auto b = storage.CreateOrAdd("de", factory);

        REQUIRE(a != b);
        REQUIRE(calls == 2);
        REQUIRE(*storage.Get(b) == 2);
        REQUIRE(storage.Contains("de"));
        REQUIRE_FALSE(storage.Contains("x"));
    }

    SECTION("Failed creation is not cached") {
        auto failing = [](const std::string&) -> size_t { throw std::runtime_error("load failed"); };

        REQUIRE_THROWS_AS(storage.CreateOrAdd("bad", failing), std::runtime_error);
        REQUIRE_FALSE(storage.Contains("bad"));
        REQUIRE(storage.Size() == 0);

        auto h = storage.CreateOrAdd("bad", factory);
        REQUIRE(*storage.Get(h) == 3);
    }
}
