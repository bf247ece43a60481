#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"
#include "wdserver/drivers/driver.hpp"

namespace wdserver::sessions {

/// An active automation session: one client bound to one driver instance.
///
/// The session owns its driver exclusively. Drivers are not safe for
/// concurrent use, so every driver call goes through `with_driver`, which
/// holds the session's execution lock for the duration of the call.
class Session {
public:
    Session(std::string id, Capabilities capabilities,
            std::unique_ptr<drivers::Driver> driver);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto capabilities() const -> const Capabilities& { return capabilities_; }

    /// Run `fn(Driver&)` while holding the execution lock and return its result.
    /// `fn` must return a Result; a closed session fails with SessionNotFound
    /// without calling it.
    template <typename Fn>
    auto with_driver(Fn&& fn) -> std::invoke_result_t<Fn, drivers::Driver&> {
        std::lock_guard lock(execution_mutex_);
        if (closed_) {
            return std::unexpected(closed_error());
        }
        return std::forward<Fn>(fn)(*driver_);
    }

    /// Run `fn(Driver&)` as the last use of the driver. The session is closed
    /// afterwards whatever `fn` returns; later `with_driver` calls fail.
    template <typename Fn>
    auto close_with(Fn&& fn) -> std::invoke_result_t<Fn, drivers::Driver&> {
        std::lock_guard lock(execution_mutex_);
        if (closed_) {
            return std::unexpected(closed_error());
        }
        closed_ = true;
        return std::forward<Fn>(fn)(*driver_);
    }

    [[nodiscard]] auto is_closed() const -> bool;

    /// Unsynchronized access for inspection. Never use to drive the browser.
    [[nodiscard]] auto driver() const -> const drivers::Driver& { return *driver_; }

private:
    [[nodiscard]] auto closed_error() const -> Error;

    std::string id_;
    Capabilities capabilities_;
    std::unique_ptr<drivers::Driver> driver_;
    mutable std::mutex execution_mutex_;
    bool closed_ = false;
};

} // namespace wdserver::sessions
