#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"
#include "wdserver/drivers/driver_registry.hpp"
#include "wdserver/sessions/session.hpp"

namespace wdserver::sessions {

/// The set of active sessions of one server, keyed by session id.
///
/// Exactly one store exists per server context. Sessions are handed out as
/// shared pointers so a handler already executing against a session keeps it
/// alive after removal; the store itself never hands the driver out again
/// once the session is removed.
class SessionStore {
public:
    explicit SessionStore(const drivers::DriverRegistry& drivers);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Instantiate a driver matching `capabilities` and store a new session
    /// for it under a fresh random id. On failure the store is unchanged.
    auto create_session(const Capabilities& capabilities) -> Result<std::string>;

    /// Look up a session; nullptr when the id is unknown.
    [[nodiscard]] auto get_session(std::string_view id) const -> std::shared_ptr<Session>;

    /// Remove a session. Unknown ids are ignored.
    /// @returns true if a session was removed.
    auto remove_session(std::string_view id) -> bool;

    /// Snapshot of the ids of all active sessions, in no particular order.
    [[nodiscard]] auto list_session_ids() const -> std::vector<std::string>;

    /// Snapshot of all active sessions, in no particular order.
    [[nodiscard]] auto list_sessions() const -> std::vector<std::shared_ptr<Session>>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    const drivers::DriverRegistry& drivers_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace wdserver::sessions
