#include "wdserver/sessions/session_store.hpp"

#include <mutex>

#include "wdserver/core/logger.hpp"
#include "wdserver/core/utils.hpp"

namespace wdserver::sessions {

SessionStore::SessionStore(const drivers::DriverRegistry& drivers)
    : drivers_(drivers) {
    LOG_INFO("Session store initialized");
}

auto SessionStore::create_session(const Capabilities& capabilities) -> Result<std::string> {
    // Driver start-up may be slow; it runs outside the store lock.
    auto driver = drivers_.create_driver(capabilities);
    if (!driver) {
        LOG_WARN("Failed to create session for {}: {}",
                 capabilities.dump(), driver.error().what());
        return std::unexpected(driver.error());
    }

    auto id = utils::generate_uuid();
    auto session = std::make_shared<Session>(id, capabilities, std::move(*driver));

    {
        std::unique_lock lock(mutex_);
        // Random 128-bit ids are not checked for uniqueness up front; a
        // taken key fails the creation instead of being retried.
        auto [it, inserted] = sessions_.try_emplace(id, std::move(session));
        if (!inserted) {
            return std::unexpected(make_error(
                ErrorCode::SessionCreationFailed,
                "Session id collision",
                id));
        }
    }

    LOG_INFO("Created session {} for {}", id, capabilities.dump());
    return id;
}

auto SessionStore::get_session(std::string_view id) const -> std::shared_ptr<Session> {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(std::string(id));
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

auto SessionStore::remove_session(std::string_view id) -> bool {
    std::shared_ptr<Session> removed;
    {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(std::string(id));
        if (it == sessions_.end()) {
            LOG_DEBUG("Session {} not found, nothing to remove", id);
            return false;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
    }

    // The driver is destroyed here, outside the lock, unless a handler
    // still holds the session.
    LOG_INFO("Removed session {}", id);
    return true;
}

auto SessionStore::list_session_ids() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

auto SessionStore::list_sessions() const -> std::vector<std::shared_ptr<Session>> {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<Session>> result;
    result.reserve(sessions_.size());
    for (const auto& [_, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

auto SessionStore::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace wdserver::sessions
