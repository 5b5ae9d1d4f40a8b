#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/hash.hpp"
#include "core/utils.hpp"

using namespace meshguard;

TEST_CASE("log::parse_level accepts known names", "[utils][log]") {
    CHECK(utils::log::parse_level("debug") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("INFO") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("verbose").has_value());
}

TEST_CASE("log::set_level round-trips", "[utils][log]") {
    const auto saved = utils::log::get_level();
    utils::log::set_level(utils::log::Level::ERROR);
    CHECK(utils::log::get_level() == utils::log::Level::ERROR);
    utils::log::set_level(saved);
}

TEST_CASE("String helpers", "[utils]") {
    CHECK(utils::trim("  padded\t\n") == "padded");
    CHECK(utils::trim("   ").empty());
    CHECK(utils::to_lower("MiXeD") == "mixed");
    CHECK(utils::escape_json("a\"b\\c\nd") == "a\\\"b\\\\c\\nd");
}

TEST_CASE("crc32_of matches the standard check value", "[utils][hash]") {
    CHECK(crc32_of("123456789") == 0xCBF43926u);
    CHECK(crc32_of("") == 0u);
}

TEST_CASE("Result carries value or category", "[error]") {
    auto ok = Result<int>::ok(7);
    REQUIRE(ok.is_ok());
    CHECK(ok.value() == 7);
    CHECK(ok.error_category() == ErrorCategory::NONE);

    auto err = Result<int>::error(ErrorCategory::CIRCUIT_OPEN, "open");
    CHECK(err.is_error());
    CHECK(err.error_message() == "open");
    CHECK(std::string(error_category_to_string(err.error_category())) == "circuit_open");

    CHECK(Status::ok().is_ok());
    CHECK(Status::error(ErrorCategory::NOT_FOUND, "x").error_category() == ErrorCategory::NOT_FOUND);
}
