#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "wdserver/core/error.hpp"
#include "wdserver/drivers/driver.hpp"
#include "wdserver/drivers/module.hpp"

namespace wdserver::testing {

/// Records every mouse action as a short string ("click", "move 3,4", ...).
class FakeMouse : public drivers::Mouse {
public:
    auto click() -> VoidResult override { return record("click"); }
    auto context_click() -> VoidResult override { return record("context_click"); }
    auto double_click() -> VoidResult override { return record("double_click"); }
    auto button_down() -> VoidResult override { return record("button_down"); }
    auto button_up() -> VoidResult override { return record("button_up"); }

    auto move_by(int x_offset, int y_offset) -> VoidResult override {
        return record("move " + std::to_string(x_offset) + "," + std::to_string(y_offset));
    }

    [[nodiscard]] auto calls() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    auto record(std::string call) -> VoidResult {
        std::lock_guard lock(mutex_);
        calls_.push_back(std::move(call));
        return ok_result();
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

/// In-memory browser with three windows. `navigate` lingers briefly and
/// tracks how many calls overlap, so tests can observe serialization.
class FakeDriver : public drivers::Driver, public drivers::HasInputDevices {
public:
    auto window_handles() -> Result<std::vector<std::string>> override {
        touch();
        return windows_;
    }

    auto current_window_handle() -> Result<std::string> override {
        touch();
        return windows_.front();
    }

    auto navigate(std::string_view url) -> VoidResult override {
        touch();
        auto active = ++active_calls_;
        auto seen = max_concurrent_calls_.load();
        while (active > seen && !max_concurrent_calls_.compare_exchange_weak(seen, active)) {
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        {
            std::lock_guard lock(state_mutex_);
            url_ = std::string(url);
            ++navigations_;
        }
        --active_calls_;
        return ok_result();
    }

    auto current_url() -> Result<std::string> override {
        touch();
        std::lock_guard lock(state_mutex_);
        return url_;
    }

    auto title() -> Result<std::string> override {
        touch();
        std::lock_guard lock(state_mutex_);
        return "Title of " + url_;
    }

    auto quit() -> VoidResult override {
        quit_called_ = true;
        return ok_result();
    }

    [[nodiscard]] auto mouse() -> drivers::Mouse& override {
        touch();
        return mouse_;
    }

    [[nodiscard]] auto fake_mouse() const -> const FakeMouse& { return mouse_; }
    [[nodiscard]] auto quit_called() const -> bool { return quit_called_; }
    /// Calls that reached the driver after quit().
    [[nodiscard]] auto calls_after_quit() const -> int { return calls_after_quit_; }
    [[nodiscard]] auto max_concurrent_calls() const -> int { return max_concurrent_calls_; }

    [[nodiscard]] auto navigations() const -> int {
        std::lock_guard lock(state_mutex_);
        return navigations_;
    }

private:
    void touch() {
        if (quit_called_) {
            ++calls_after_quit_;
        }
    }

    std::vector<std::string> windows_{"window-1", "window-2", "window-3"};
    FakeMouse mouse_;

    mutable std::mutex state_mutex_;
    std::string url_ = "about:blank";
    int navigations_ = 0;

    std::atomic<int> active_calls_{0};
    std::atomic<int> max_concurrent_calls_{0};
    std::atomic<bool> quit_called_{false};
    std::atomic<int> calls_after_quit_{0};
};

/// A driver without input devices.
class HeadlessDriver : public drivers::Driver {
public:
    auto window_handles() -> Result<std::vector<std::string>> override {
        return std::vector<std::string>{"headless-1"};
    }
    auto current_window_handle() -> Result<std::string> override { return std::string("headless-1"); }
    auto navigate(std::string_view) -> VoidResult override { return ok_result(); }
    auto current_url() -> Result<std::string> override { return std::string("about:blank"); }
    auto title() -> Result<std::string> override { return std::string(); }
    auto quit() -> VoidResult override { return ok_result(); }
};

/// A driver whose browser fails every operation.
class BrokenDriver : public drivers::Driver {
public:
    auto window_handles() -> Result<std::vector<std::string>> override { return failure(); }
    auto current_window_handle() -> Result<std::string> override { return failure(); }
    auto navigate(std::string_view) -> VoidResult override { return failure(); }
    auto current_url() -> Result<std::string> override { return failure(); }
    auto title() -> Result<std::string> override { return failure(); }
    auto quit() -> VoidResult override { return failure(); }

private:
    static auto failure() -> std::unexpected<Error> {
        return std::unexpected(make_error(ErrorCode::DriverError, "browser crashed"));
    }
};

/// Exported by the modules but not a driver.
class NotADriver {
public:
    int value = 0;
};

/// Module linked into the test binary.
class FakeDriverModule : public drivers::DriverModule {
public:
    static constexpr std::string_view kName = "FakeDrivers";

    FakeDriverModule()
        : types_{
              drivers::make_backend_type<FakeDriver>("FakeDriver"),
              drivers::make_backend_type<HeadlessDriver>("HeadlessDriver"),
              drivers::make_backend_type<BrokenDriver>("BrokenDriver"),
              drivers::make_backend_type<NotADriver>("NotADriver"),
          } {}

    [[nodiscard]] auto name() const -> std::string_view override { return kName; }
    [[nodiscard]] auto version() const -> std::string_view override { return "1.0.0"; }
    [[nodiscard]] auto types() const -> const std::vector<drivers::BackendType>& override {
        return types_;
    }

private:
    std::vector<drivers::BackendType> types_;
};

} // namespace wdserver::testing
