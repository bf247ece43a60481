#include "wdserver/server/context.hpp"

#include "wdserver/commands/standard_registry.hpp"
#include "wdserver/core/logger.hpp"

namespace wdserver::server {

ServerContext::ServerContext(ServerConfig config)
    : config_(std::move(config))
    , drivers_(modules_, resolve_driver_library_dir(config_))
    , sessions_(drivers_)
    , commands_(std::make_unique<commands::StandardCommandRegistry>(sessions_)) {
    commands_->initialize();
    LOG_INFO("Server context ready (driver libraries: {})", drivers_.library_dir().string());
}

ServerContext::~ServerContext() {
    auto remaining = sessions_.size();
    if (remaining > 0) {
        LOG_WARN("Shutting down with {} active session(s)", remaining);
    }
}

auto ServerContext::register_configured_drivers(const drivers::RegistrationFailedCallback& on_failed)
    -> std::size_t {
    std::size_t registered = 0;
    for (const auto& entry : config_.drivers) {
        if (drivers_.register_driver(entry.capabilities, entry.type, on_failed)) {
            ++registered;
        }
    }

    LOG_INFO("Registered {} of {} configured driver(s)", registered, config_.drivers.size());
    return registered;
}

} // namespace wdserver::server
