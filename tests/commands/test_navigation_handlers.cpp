#include <catch2/catch_test_macros.hpp>

#include "support/test_server.hpp"
#include "wdserver/commands/navigation_handlers.hpp"

using namespace wdserver;
using namespace wdserver::commands;
using wdserver::testing::TestServer;

TEST_CASE("get navigates the session's browser", "[commands][navigation]") {
    TestServer server;
    auto id = server.new_session();

    auto result = server.run(Command::Get, id, {{"url", "https://example.com/"}});
    REQUIRE(result.has_value());
    CHECK(result->is_null());

    auto url = server.run(Command::GetCurrentUrl, id);
    REQUIRE(url.has_value());
    CHECK(*url == "https://example.com/");

    auto title = server.run(Command::GetTitle, id);
    REQUIRE(title.has_value());
    CHECK(*title == "Title of https://example.com/");
}

TEST_CASE("get validates its url parameter", "[commands][navigation]") {
    TestServer server;
    auto id = server.new_session();
    LocatorParameters locator{{"sessionId", id}};

    SECTION("missing url") {
        auto handler = server.registry.create(Command::Get, locator, json::object());
        REQUIRE_FALSE(handler.has_value());
        CHECK(handler.error().code() == ErrorCode::HandlerConstructionFailed);
        CHECK(handler.error().detail() == "url");
    }

    SECTION("null url counts as missing") {
        auto handler = server.registry.create(Command::Get, locator, {{"url", nullptr}});
        REQUIRE_FALSE(handler.has_value());
        CHECK(handler.error().code() == ErrorCode::HandlerConstructionFailed);
    }

    SECTION("url of the wrong type") {
        auto handler = server.registry.create(Command::Get, locator, {{"url", 42}});
        REQUIRE_FALSE(handler.has_value());
        CHECK(handler.error().code() == ErrorCode::HandlerConstructionFailed);
    }

    SECTION("empty url") {
        auto handler = server.registry.create(Command::Get, locator, {{"url", ""}});
        REQUIRE_FALSE(handler.has_value());
        CHECK(handler.error().code() == ErrorCode::HandlerConstructionFailed);
    }

    SECTION("describe names the target") {
        auto handler = server.registry.create(Command::Get, locator, {{"url", "about:blank"}});
        REQUIRE(handler.has_value());
        CHECK((*handler)->describe() == "[navigate to: about:blank]");
    }

    CHECK(server.fake_driver(id).navigations() == 0);
}

TEST_CASE("navigation failures come from the driver", "[commands][navigation]") {
    TestServer server;
    auto id = server.new_session({{"browserName", "broken"}});

    auto result = server.run(Command::Get, id, {{"url", "https://example.com/"}});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::DriverError);
}
