#pragma once

#include <cstddef>
#include <memory>

#include "wdserver/commands/registry.hpp"
#include "wdserver/core/config.hpp"
#include "wdserver/drivers/driver_registry.hpp"
#include "wdserver/drivers/module_loader.hpp"
#include "wdserver/sessions/session_store.hpp"

namespace wdserver::server {

/// The process-wide state of one server: module loader, driver registry,
/// session store and command registry, constructed once at startup and
/// passed by reference to whatever serves requests.
///
/// Members are destroyed in reverse order, so sessions (and the drivers they
/// own) go before the modules whose code implements those drivers.
class ServerContext {
public:
    explicit ServerContext(ServerConfig config);
    ~ServerContext();

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    /// Register every driver listed in the configuration.
    /// @returns the number of successful registrations.
    auto register_configured_drivers(const drivers::RegistrationFailedCallback& on_failed = {})
        -> std::size_t;

    [[nodiscard]] auto config() const -> const ServerConfig& { return config_; }
    [[nodiscard]] auto modules() -> drivers::ModuleLoader& { return modules_; }
    [[nodiscard]] auto drivers() -> drivers::DriverRegistry& { return drivers_; }
    [[nodiscard]] auto sessions() -> sessions::SessionStore& { return sessions_; }
    [[nodiscard]] auto commands() -> commands::CommandRegistry& { return *commands_; }

private:
    ServerConfig config_;
    drivers::ModuleLoader modules_;
    drivers::DriverRegistry drivers_;
    sessions::SessionStore sessions_;
    std::unique_ptr<commands::CommandRegistry> commands_;
};

} // namespace wdserver::server
