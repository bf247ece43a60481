#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "support/test_server.hpp"
#include "wdserver/sessions/session_store.hpp"

using namespace wdserver;
using wdserver::testing::TestServer;

TEST_CASE("SessionStore creates sessions", "[sessions][store]") {
    TestServer server;

    SECTION("new session is retrievable") {
        auto id = server.sessions.create_session(json::object());
        REQUIRE(id.has_value());
        CHECK(id->size() == 36);

        auto session = server.sessions.get_session(*id);
        REQUIRE(session != nullptr);
        CHECK(session->id() == *id);
        CHECK(server.sessions.size() == 1);
    }

    SECTION("session keeps the requested capabilities") {
        Capabilities caps = {{"browserName", "headless"}, {"javascriptEnabled", true}};
        auto id = server.new_session(caps);
        CHECK(server.sessions.get_session(id)->capabilities() == caps);
    }

    SECTION("session driver is the registered type") {
        wdserver::drivers::ModuleLoader modules;
        modules.add(std::make_unique<wdserver::testing::FakeDriverModule>());
        wdserver::drivers::DriverRegistry drivers(modules, WDSERVER_TEST_DRIVER_DIR);
        sessions::SessionStore store(drivers);
        REQUIRE(drivers.register_driver({{"browser", "test"}}, "HeadlessDriver, FakeDrivers"));

        auto id = store.create_session({{"browser", "test"}});
        REQUIRE(id.has_value());
        auto session = store.get_session(*id);
        REQUIRE(session != nullptr);
        CHECK(dynamic_cast<const wdserver::testing::HeadlessDriver*>(&session->driver()) != nullptr);
    }

    SECTION("unmatched capabilities leave the store unchanged") {
        wdserver::drivers::ModuleLoader modules;
        wdserver::drivers::DriverRegistry empty(modules, WDSERVER_TEST_DRIVER_DIR);
        sessions::SessionStore store(empty);

        auto id = store.create_session({{"browserName", "nothing"}});
        REQUIRE_FALSE(id.has_value());
        CHECK(id.error().code() == ErrorCode::SessionCreationFailed);
        CHECK(store.size() == 0);
    }
}

TEST_CASE("SessionStore assigns distinct ids", "[sessions][store]") {
    TestServer server;
    constexpr int kSessions = 100;

    SECTION("sequential creation") {
        std::set<std::string> ids;
        for (int i = 0; i < kSessions; ++i) {
            ids.insert(server.new_session());
        }
        CHECK(ids.size() == kSessions);
        CHECK(server.sessions.size() == kSessions);
    }

    SECTION("concurrent creation") {
        std::mutex ids_mutex;
        std::set<std::string> ids;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < kSessions / 4; ++i) {
                    auto id = server.sessions.create_session(json::object());
                    if (id) {
                        std::lock_guard lock(ids_mutex);
                        ids.insert(*id);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        CHECK(ids.size() == kSessions);
        CHECK(server.sessions.size() == kSessions);
    }
}

TEST_CASE("SessionStore removes sessions", "[sessions][store]") {
    TestServer server;
    auto id = server.new_session();

    SECTION("removed session is no longer found") {
        CHECK(server.sessions.remove_session(id));
        CHECK(server.sessions.get_session(id) == nullptr);
        CHECK(server.sessions.size() == 0);
    }

    SECTION("removal is idempotent") {
        CHECK(server.sessions.remove_session(id));
        CHECK_FALSE(server.sessions.remove_session(id));
        CHECK_FALSE(server.sessions.remove_session("never-existed"));
    }

    SECTION("removing an unknown id leaves the store unchanged") {
        auto other = server.new_session();
        auto before = server.sessions.list_session_ids();
        CHECK_FALSE(server.sessions.remove_session("never-existed"));
        auto after = server.sessions.list_session_ids();
        CHECK(std::set<std::string>(before.begin(), before.end()) ==
              std::set<std::string>(after.begin(), after.end()));
        CHECK(after.size() == 2);
        CHECK(server.sessions.get_session(other) != nullptr);
    }

    SECTION("a held session outlives its removal") {
        auto session = server.sessions.get_session(id);
        server.sessions.remove_session(id);
        REQUIRE(session != nullptr);
        auto handles = session->with_driver([](drivers::Driver& driver) {
            return driver.window_handles();
        });
        CHECK(handles.has_value());
    }
}

TEST_CASE("SessionStore lists sessions", "[sessions][store]") {
    TestServer server;
    CHECK(server.sessions.list_session_ids().empty());

    auto a = server.new_session();
    auto b = server.new_session({{"browserName", "headless"}});

    auto ids = server.sessions.list_session_ids();
    CHECK(std::set<std::string>(ids.begin(), ids.end()) == std::set<std::string>{a, b});
    CHECK(server.sessions.list_sessions().size() == 2);

    CHECK(server.sessions.get_session("unknown") == nullptr);
}
