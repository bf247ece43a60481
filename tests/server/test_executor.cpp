#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include "support/test_server.hpp"
#include "wdserver/server/executor.hpp"

using namespace wdserver;
using namespace wdserver::commands;
using wdserver::testing::TestServer;

namespace {

auto locator_for(const std::string& id) -> LocatorParameters {
    return LocatorParameters{{std::string(kSessionIdKey), id}};
}

} // anonymous namespace

TEST_CASE("CommandExecutor runs commands inline", "[server][executor]") {
    TestServer server;
    server::CommandExecutor executor(server.registry, 2);
    auto id = server.new_session();

    SECTION("successful command") {
        auto result = executor.run(Command::GetWindowHandles, locator_for(id), json::object());
        REQUIRE(result.has_value());
        CHECK(result->size() == 3);
    }

    SECTION("construction failure") {
        auto result = executor.run(Command::Get, locator_for(id), json::object());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::HandlerConstructionFailed);
    }

    SECTION("unsupported command") {
        auto result = executor.run(Command::Screenshot, locator_for(id), json::object());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::UnsupportedCommand);
    }
}

TEST_CASE("CommandExecutor serializes commands per session", "[server][executor]") {
    TestServer server;
    server::CommandExecutor executor(server.registry, 8);
    auto id = server.new_session();
    constexpr int kCommands = 32;

    std::vector<std::future<Result<json>>> futures;
    for (int i = 0; i < kCommands; ++i) {
        futures.push_back(executor.submit(
            Command::Get, locator_for(id),
            {{"url", "https://example.com/" + std::to_string(i)}}));
    }
    for (auto& future : futures) {
        CHECK(future.get().has_value());
    }

    const auto& driver = server.fake_driver(id);
    CHECK(driver.navigations() == kCommands);
    CHECK(driver.max_concurrent_calls() == 1);
}

TEST_CASE("CommandExecutor runs different sessions independently", "[server][executor]") {
    TestServer server;
    server::CommandExecutor executor(server.registry, 4);

    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(server.new_session());
    }

    std::vector<std::future<Result<json>>> futures;
    for (int round = 0; round < 5; ++round) {
        for (const auto& id : ids) {
            futures.push_back(executor.submit(Command::Get, locator_for(id),
                                              {{"url", "https://example.com/"}}));
        }
    }
    for (auto& future : futures) {
        CHECK(future.get().has_value());
    }

    for (const auto& id : ids) {
        CHECK(server.fake_driver(id).navigations() == 5);
        CHECK(server.fake_driver(id).max_concurrent_calls() == 1);
    }
}

TEST_CASE("CommandExecutor shutdown drains queued work", "[server][executor]") {
    TestServer server;
    auto id = server.new_session();

    std::vector<std::future<Result<json>>> futures;
    {
        server::CommandExecutor executor(server.registry, 2);
        for (int i = 0; i < 8; ++i) {
            futures.push_back(executor.submit(Command::MouseClick, locator_for(id),
                                              {{"button", i % 2}}));
        }
        executor.shutdown();
        executor.shutdown();
    }

    for (auto& future : futures) {
        CHECK(future.get().has_value());
    }
    CHECK(server.fake_driver(id).fake_mouse().calls().size() == 8);
}

TEST_CASE("CommandExecutor rejects work after shutdown", "[server][executor]") {
    TestServer server;
    auto id = server.new_session();
    server::CommandExecutor executor(server.registry, 2);
    executor.shutdown();

    auto future = executor.submit(Command::Get, locator_for(id), {{"url", "https://example.com/"}});
    REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);

    auto result = future.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InternalError);
    CHECK(server.fake_driver(id).navigations() == 0);

    SECTION("inline execution still works") {
        CHECK(executor.run(Command::GetTitle, locator_for(id), json::object()).has_value());
    }
}
