#include <catch2/catch_test_macros.hpp>

#include "utils/Base64.hpp"
#include "utils/BoundedQueue.hpp"
#include "utils/TextUtils.hpp"
#include "utils/TimeUtils.hpp"
#include "utils/TypeName.hpp"

#include <chrono>
#include <map>
#include <stdexcept>
#include <thread>
#include <typeinfo>
#include <vector>

using namespace checkend::utils;

TEST_CASE("BoundedQueue enforces capacity", "[utils][queue]") {
    BoundedQueue<int> q(2);

    REQUIRE(q.tryPush(1));
    REQUIRE(q.tryPush(2));
    REQUIRE_FALSE(q.tryPush(3));
    REQUIRE(q.size() == 2);

    int out = 0;
    REQUIRE(q.tryPop(out));
    REQUIRE(out == 1);
    REQUIRE(q.tryPush(3));

    REQUIRE(q.clear() == 2);
    REQUIRE(q.empty());
    REQUIRE_FALSE(q.tryPop(out));
}

TEST_CASE("BoundedQueue rejects pushes once closed", "[utils][queue]") {
    BoundedQueue<int> q(4);
    REQUIRE(q.tryPush(1));

    q.close();
    REQUIRE(q.isClosed());
    REQUIRE_FALSE(q.tryPush(2));
    REQUIRE(q.size() == 1);

    int out = 0;
    REQUIRE(q.tryPop(out));
    REQUIRE(out == 1);
    REQUIRE_FALSE(q.tryPush(3));
}

TEST_CASE("BoundedQueue popFor waits for producers", "[utils][queue]") {
    BoundedQueue<int> q(4);
    int out = 0;

    REQUIRE_FALSE(q.popFor(out, std::chrono::milliseconds(20)));

    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.tryPush(7);
    });
    REQUIRE(q.popFor(out, std::chrono::seconds(5)));
    REQUIRE(out == 7);
    producer.join();
}

TEST_CASE("UTF-8 helpers count code points", "[utils][text]") {
    const std::string mixed = "a\xC3\xA9\xE3\x81\x82";  // a, e-acute, hiragana a

    REQUIRE(utf8Length(mixed) == 3);
    REQUIRE(utf8Truncate(mixed, 2) == "a\xC3\xA9");
    REQUIRE(utf8Truncate(mixed, 10) == mixed);
    REQUIRE(utf8Truncate("abc", 0).empty());

    SECTION("Invalid bytes count as one character") {
        const std::string broken = "ab\xFF" "c";
        REQUIRE(utf8Length(broken) == 4);
    }
}

TEST_CASE("toLowerUtf8 folds ASCII and non-ASCII letters", "[utils][text]") {
    REQUIRE(toLowerUtf8("API_Key") == "api_key");
    REQUIRE(toLowerUtf8("\xC3\x89T\xC3\x89") == "\xC3\xA9t\xC3\xA9");  // ÉTÉ -> été
    REQUIRE(startsWith("https://x", "https://"));
    REQUIRE(endsWith("app::NotFound", "::NotFound"));
    REQUIRE_FALSE(endsWith("a", "abc"));
}

TEST_CASE("base64Encode pads output", "[utils][base64]") {
    REQUIRE(base64Encode("").empty());
    REQUIRE(base64Encode("f") == "Zg==");
    REQUIRE(base64Encode("fo") == "Zm8=");
    REQUIRE(base64Encode("foo") == "Zm9v");
    REQUIRE(base64Encode("user:pass") == "dXNlcjpwYXNz");
}

TEST_CASE("Type names are demangled and shortened", "[utils][typename]") {
    REQUIRE(demangledName(typeid(std::out_of_range)) == "std::out_of_range");
    REQUIRE(simpleName("std::out_of_range") == "out_of_range");
    REQUIRE(simpleName("ns::Wrapper<std::string>") == "Wrapper<std::string>");
    REQUIRE(simpleName("plain") == "plain");
}

TEST_CASE("formatIso8601 renders UTC with milliseconds", "[utils][time]") {
    const auto epoch = std::chrono::system_clock::time_point{};
    REQUIRE(formatIso8601(epoch) == "1970-01-01T00:00:00.000Z");
    REQUIRE(formatIso8601(epoch + std::chrono::milliseconds(86400000 + 5)) == "1970-01-02T00:00:00.005Z");
}
