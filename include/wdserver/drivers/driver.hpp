#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wdserver/core/error.hpp"

namespace wdserver::drivers {

/// Pointer device of a driver. All actions operate at the last coordinates
/// the device was moved to.
class Mouse {
public:
    virtual ~Mouse() = default;

    virtual auto click() -> VoidResult = 0;
    virtual auto context_click() -> VoidResult = 0;
    virtual auto double_click() -> VoidResult = 0;
    virtual auto button_down() -> VoidResult = 0;
    virtual auto button_up() -> VoidResult = 0;

    /// Move the pointer relative to its current position.
    virtual auto move_by(int x_offset, int y_offset) -> VoidResult = 0;
};

/// Implemented by drivers that can synthesize input device events.
class HasInputDevices {
public:
    virtual ~HasInputDevices() = default;

    [[nodiscard]] virtual auto mouse() -> Mouse& = 0;
};

/// A session-drivable automation backend.
///
/// A driver instance is owned by exactly one session and is never invoked
/// concurrently; implementations need not be thread-safe. Failures are
/// reported as Result errors and reach the protocol client unmodified.
class Driver {
public:
    virtual ~Driver() = default;

    /// Opaque handles of every open top-level window, in driver order.
    virtual auto window_handles() -> Result<std::vector<std::string>> = 0;
    virtual auto current_window_handle() -> Result<std::string> = 0;

    virtual auto navigate(std::string_view url) -> VoidResult = 0;
    virtual auto current_url() -> Result<std::string> = 0;
    virtual auto title() -> Result<std::string> = 0;

    /// End the browser session. The driver is not used afterwards.
    virtual auto quit() -> VoidResult = 0;
};

} // namespace wdserver::drivers
