#include <catch2/catch_test_macros.hpp>
#include <mediaseek/util/from_string.hpp>

using namespace mediaseek;

TEST_CASE("FromString integral types", "[from_string]") {
    SECTION("uint32_t") {
        auto result = from_string<uint32_t>("30");
        REQUIRE(result.has_value());
        REQUIRE(*result == 30u);
    }

    SECTION("size_t") {
        auto result = from_string<size_t>("262144");
        REQUIRE(result.has_value());
        REQUIRE(*result == 262144u);
    }

    SECTION("invalid integer") {
        auto result = from_string<int>("not_a_number");
        REQUIRE(!result.has_value());
        REQUIRE(result.error().is(StreamError::InvalidConfig));
    }

    SECTION("empty string") {
        REQUIRE(!from_string<int>("").has_value());
    }

    SECTION("partial number") {
        REQUIRE(!from_string<int>("42abc").has_value());
    }

    SECTION("out of range") {
        auto result = from_string<uint8_t>("300");
        REQUIRE(!result.has_value());
        REQUIRE(std::string(result.error().message()).find("out of range") != std::string::npos);
    }

    SECTION("negative into unsigned") {
        REQUIRE(!from_string<uint32_t>("-1").has_value());
    }
}

TEST_CASE("FromString bool", "[from_string]") {
    for (auto s : {"true", "1", "yes", "on"}) {
        auto result = from_string<bool>(s);
        REQUIRE(result.has_value());
        CHECK(*result);
    }
    for (auto s : {"false", "0", "no", "off"}) {
        auto result = from_string<bool>(s);
        REQUIRE(result.has_value());
        CHECK(!*result);
    }
    REQUIRE(!from_string<bool>("maybe").has_value());
}

TEST_CASE("FromString string", "[from_string]") {
    auto result = from_string<std::string>("7za");
    REQUIRE(result.has_value());
    REQUIRE(*result == "7za");
}

TEST_CASE("FromString seconds", "[from_string]") {
    SECTION("whole seconds") {
        auto result = from_string<std::chrono::seconds>("30");
        REQUIRE(result.has_value());
        REQUIRE(*result == std::chrono::seconds(30));
    }

    SECTION("negative is rejected") {
        REQUIRE(!from_string<std::chrono::seconds>("-5").has_value());
    }

    SECTION("units are not accepted") {
        REQUIRE(!from_string<std::chrono::seconds>("30s").has_value());
    }
}

TEST_CASE("Parseable concept", "[from_string]") {
    STATIC_REQUIRE(Parseable<int>);
    STATIC_REQUIRE(Parseable<bool>);
    STATIC_REQUIRE(Parseable<std::string>);
    STATIC_REQUIRE(Parseable<std::chrono::seconds>);
}
