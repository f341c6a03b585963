#include <catch2/catch_test_macros.hpp>

#include <prompter/core/time_parser.h>

#include <chrono>

using namespace std::chrono_literals;
using prompter::core::TimeParser;

namespace {
prompter::TimePoint utc(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
    return std::chrono::sys_days{std::chrono::year{y} / m / d} + std::chrono::hours{hh} +
           std::chrono::minutes{mm} + std::chrono::seconds{ss};
}
} // namespace

TEST_CASE("TimeParser parses UTC timestamps", "[core][time_parser]") {
    auto tp = TimeParser::parseISO8601("2024-01-15T10:20:30Z");
    REQUIRE(tp.has_value());
    CHECK(*tp == utc(2024, 1, 15, 10, 20, 30));

    auto noZone = TimeParser::parseISO8601("2024-01-15T10:20:30");
    REQUIRE(noZone.has_value());
    CHECK(*noZone == *tp);
}

TEST_CASE("TimeParser keeps millisecond fractions", "[core][time_parser]") {
    auto tp = TimeParser::parseISO8601("2024-01-15T10:20:30.123Z");
    REQUIRE(tp.has_value());
    CHECK(*tp == utc(2024, 1, 15, 10, 20, 30) + 123ms);

    SECTION("short fractions are scaled") {
        auto half = TimeParser::parseISO8601("2024-01-15T10:20:30.5Z");
        REQUIRE(half.has_value());
        CHECK(*half == utc(2024, 1, 15, 10, 20, 30) + 500ms);
    }

    SECTION("sub-millisecond digits are dropped") {
        auto fine = TimeParser::parseISO8601("2024-01-15T10:20:30.123456Z");
        REQUIRE(fine.has_value());
        CHECK(*fine == utc(2024, 1, 15, 10, 20, 30) + 123ms);
    }
}

TEST_CASE("TimeParser applies zone offsets", "[core][time_parser]") {
    auto plus = TimeParser::parseISO8601("2024-01-15T12:20:30+02:00");
    REQUIRE(plus.has_value());
    CHECK(*plus == utc(2024, 1, 15, 10, 20, 30));

    auto minus = TimeParser::parseISO8601("2024-01-15T05:20:30-0500");
    REQUIRE(minus.has_value());
    CHECK(*minus == utc(2024, 1, 15, 10, 20, 30));
}

TEST_CASE("TimeParser accepts date-only input", "[core][time_parser]") {
    auto tp = TimeParser::parseISO8601("2024-02-29");
    REQUIRE(tp.has_value());
    CHECK(*tp == utc(2024, 2, 29));
}

TEST_CASE("TimeParser rejects malformed input", "[core][time_parser]") {
    CHECK_FALSE(TimeParser::parseISO8601("").has_value());
    CHECK_FALSE(TimeParser::parseISO8601("yesterday").has_value());
    CHECK_FALSE(TimeParser::parseISO8601("2024-01-15T10:20:30.Z").has_value());
    CHECK_FALSE(TimeParser::parseISO8601("2024-01-15T10:20:30Zjunk").has_value());
    CHECK_FALSE(TimeParser::parseISO8601("2024-01-15 trailing").has_value());
}

TEST_CASE("TimeParser formats with milliseconds in UTC", "[core][time_parser]") {
    auto tp = utc(2023, 12, 31, 23, 59, 58) + 7ms;
    CHECK(TimeParser::formatISO8601(tp) == "2023-12-31T23:59:58.007Z");

    auto whole = TimeParser::formatISO8601(utc(2024, 3, 1, 9));
    CHECK(whole == "2024-03-01T09:00:00.000Z");
}

TEST_CASE("TimeParser round trip is exact at millisecond precision", "[core][time_parser]") {
    auto now = TimeParser::toMillis(std::chrono::system_clock::now());
    auto text = TimeParser::formatISO8601(now);
    auto parsed = TimeParser::parseISO8601(text);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == now);

    auto raw = std::chrono::system_clock::now();
    CHECK(TimeParser::toMillis(raw) <= raw);
    CHECK(raw - TimeParser::toMillis(raw) < 1ms);
}
