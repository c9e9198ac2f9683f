#include <catch2/catch_test_macros.hpp>
#include "lifecycle/value_generator.hpp"

#include <set>
#include <string>

using namespace kvault;

TEST_CASE("ValueGenerator: default length and alphabet", "[generator]") {
    RandomValueGenerator gen;
    auto value = gen.generate();
    REQUIRE(value.is_ok());
    CHECK(value.value().size() == RandomValueGenerator::kDefaultLength);

    const auto chars = RandomValueGenerator::alphabet(Charset::ALPHANUMERIC);
    for (const char c : value.value().view()) {
        CHECK(chars.find(c) != std::string_view::npos);
    }
}

TEST_CASE("ValueGenerator: every charset stays inside its alphabet", "[generator]") {
    for (const auto cs : {Charset::ALPHANUMERIC, Charset::ALPHANUMERIC_SYMBOLS, Charset::HEX,
                          Charset::BASE64, Charset::NUMERIC, Charset::UPPERCASE, Charset::LOWERCASE}) {
        RandomValueGenerator gen{.length = 256, .charset = cs};
        auto value = gen.generate();
        REQUIRE(value.is_ok());
        REQUIRE(value.value().size() == 256);
        const auto chars = RandomValueGenerator::alphabet(cs);
        for (const char c : value.value().view()) {
            CHECK(chars.find(c) != std::string_view::npos);
        }
    }
}

TEST_CASE("ValueGenerator: consecutive values differ", "[generator]") {
    RandomValueGenerator gen;
    auto a = gen.generate();
    auto b = gen.generate();
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK_FALSE(a.value() == b.value());
}

TEST_CASE("ValueGenerator: large output covers the alphabet", "[generator]") {
    RandomValueGenerator gen{.length = 4096, .charset = Charset::HEX};
    auto value = gen.generate();
    REQUIRE(value.is_ok());
    const auto text = value.value().view();
    const std::set<char> seen(text.begin(), text.end());
    CHECK(seen.size() == 16);
}

TEST_CASE("ValueGenerator: length bounds", "[generator]") {
    RandomValueGenerator zero{.length = 0};
    auto empty = zero.generate();
    REQUIRE(empty.is_error());
    CHECK(empty.error_code() == ErrorCode::VALIDATION);

    RandomValueGenerator huge{.length = RandomValueGenerator::kMaxLength + 1};
    auto over = huge.generate();
    REQUIRE(over.is_error());
    CHECK(over.error_code() == ErrorCode::VALIDATION);

    RandomValueGenerator one{.length = 1};
    auto single = one.generate();
    REQUIRE(single.is_ok());
    CHECK(single.value().size() == 1);
}

TEST_CASE("ValueGenerator: charset names", "[generator]") {
    CHECK(RandomValueGenerator::parse_charset("hex") == Charset::HEX);
    CHECK(RandomValueGenerator::parse_charset("BASE64") == Charset::BASE64);
    CHECK(RandomValueGenerator::parse_charset("symbols") == Charset::ALPHANUMERIC_SYMBOLS);
    CHECK_FALSE(RandomValueGenerator::parse_charset("emoji").has_value());
}
