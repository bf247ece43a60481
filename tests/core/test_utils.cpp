#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <set>

#include "wdserver/core/utils.hpp"

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = wdserver::utils::generate_uuid();
    // 8-4-4-4-12
    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');
}

TEST_CASE("generate_uuid does not repeat", "[utils]") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(wdserver::utils::generate_uuid());
    }
    CHECK(seen.size() == 1000);
}

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(wdserver::utils::trim("  hello  ") == "hello");
    }

    SECTION("tabs and newlines") {
        REQUIRE(wdserver::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("only whitespace") {
        REQUIRE(wdserver::utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(wdserver::utils::trim("  Chrome Driver  ") == "Chrome Driver");
    }
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("type descriptor") {
        auto parts = wdserver::utils::split("ChromeDriver, Drivers", ',');
        REQUIRE(parts.size() == 2);
        CHECK(parts[0] == "ChromeDriver");
        CHECK(parts[1] == " Drivers");
    }

    SECTION("no delimiter present") {
        auto parts = wdserver::utils::split("ChromeDriver", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "ChromeDriver");
    }

    SECTION("empty string") {
        CHECK(wdserver::utils::split("", ',').empty());
    }

    SECTION("consecutive delimiters") {
        auto parts = wdserver::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1] == "");
    }
}

TEST_CASE("case-insensitive comparison", "[utils]") {
    CHECK(wdserver::utils::to_lower("FakeDriver") == "fakedriver");
    CHECK(wdserver::utils::iequals("FakeDriver", "fakedriver"));
    CHECK(wdserver::utils::iequals("", ""));
    CHECK_FALSE(wdserver::utils::iequals("FakeDriver", "FakeDrivers"));
}

TEST_CASE("executable_dir names an existing directory", "[utils]") {
    auto dir = wdserver::utils::executable_dir();
    CHECK_FALSE(dir.empty());
    CHECK(std::filesystem::is_directory(dir));
}
