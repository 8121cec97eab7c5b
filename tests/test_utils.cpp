#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "core/error.hpp"

using namespace wgpeers;

TEST_CASE("utils::trim", "[utils]") {
    CHECK(utils::trim("  abc  ") == "abc");
    CHECK(utils::trim("\t a b \r\n") == "a b");
    CHECK(utils::trim("   ").empty());
    CHECK(utils::trim("").empty());
    CHECK(utils::trim("x") == "x");
}

TEST_CASE("utils::starts_with_ci", "[utils]") {
    CHECK(utils::starts_with_ci("PublicKey = x", "publickey"));
    CHECK(utils::starts_with_ci("PUBLICKEY", "publickey"));
    CHECK(utils::starts_with_ci("publickeyExtra", "publickey"));
    CHECK_FALSE(utils::starts_with_ci(" PublicKey", "publickey"));
    CHECK_FALSE(utils::starts_with_ci("Public", "publickey"));
    CHECK_FALSE(utils::starts_with_ci("PresharedKey = x", "publickey"));
}

TEST_CASE("utils::starts_with_ci leaves multi-byte values alone", "[utils]") {
    const std::string line = "AllowedIPs = 10.0.0.1/32 # \xC3\x89t\xC3\xA9";
    REQUIRE(utils::starts_with_ci(line, "allowedips"));
    CHECK(utils::after_char(line, '=') == " 10.0.0.1/32 # \xC3\x89t\xC3\xA9");
}

TEST_CASE("utils::after_char", "[utils]") {
    CHECK(utils::after_char("a=b=c", '=') == "b=c");
    CHECK(utils::after_char("a=", '=').empty());
    CHECK(utils::after_char("no separator", '=') == "no separator");
}

TEST_CASE("utils::split_lines", "[utils]") {

    SECTION("LF and CRLF") {
        auto lines = utils::split_lines("a\r\nb\n\nc");
        REQUIRE(lines.size() == 4);
        CHECK(lines[0] == "a");
        CHECK(lines[1] == "b");
        CHECK(lines[2].empty());
        CHECK(lines[3] == "c");
    }

    SECTION("Trailing newline adds no line") {
        CHECK(utils::split_lines("a\n").size() == 1);
        CHECK(utils::split_lines("").empty());
        CHECK(utils::split_lines("\n").size() == 1);
    }
}

TEST_CASE("utils::log::parse_level", "[utils][log]") {
    CHECK(utils::log::parse_level("debug") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level(" INFO ") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("warn") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("trace").has_value());
}

TEST_CASE("utils::log level threshold", "[utils][log]") {
    const auto saved = utils::log::level();

    utils::log::set_level(utils::log::Level::WARN);
    CHECK_FALSE(utils::log::enabled(utils::log::Level::DEBUG));
    CHECK_FALSE(utils::log::enabled(utils::log::Level::INFO));
    CHECK(utils::log::enabled(utils::log::Level::WARN));
    CHECK(utils::log::enabled(utils::log::Level::ERROR));

    utils::log::set_level(saved);
}

TEST_CASE("Result carries value or error", "[utils][error]") {
    auto ok = Result<int>::ok(42);
    REQUIRE(ok.is_ok());
    CHECK(ok.value() == 42);

    auto err = Result<int>::error(ErrorCategory::IO_ERROR, "boom");
    REQUIRE(err.is_error());
    CHECK(err.error_category() == ErrorCategory::IO_ERROR);
    CHECK(err.error_message() == "boom");
    CHECK(std::string(error_category_name(err.error_category())) == "io_error");
    CHECK(std::string(error_category_name(ErrorCategory::NONE)) == "none");
}
