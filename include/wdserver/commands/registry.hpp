#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "wdserver/commands/command.hpp"
#include "wdserver/commands/handler.hpp"
#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"
#include "wdserver/sessions/session_store.hpp"

namespace wdserver::commands {

/// Builds a handler from request parameters, or fails with
/// HandlerConstructionFailed.
using HandlerConstructor =
    std::function<Result<std::unique_ptr<CommandHandler>>(const HandlerContext&)>;

/// Maps command identifiers to handler constructors for one server flavor.
///
/// Subclasses supply the mapping in `add_handlers`, which `initialize` runs
/// once at startup before any request is served. Afterwards the mapping is
/// read-only. Commands without a constructor resolve to
/// UnsupportedCommandHandler, so `create` only fails when a handler rejects
/// its parameters.
class CommandRegistry {
public:
    explicit CommandRegistry(sessions::SessionStore& sessions);
    virtual ~CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /// Run the one-time registration step. Further calls do nothing.
    void initialize();

    /// True iff a constructor is registered for `command`.
    [[nodiscard]] auto can_handle(Command command) const -> bool;

    /// Construct the handler for `command`. Construction is serialized.
    auto create(Command command,
                const LocatorParameters& locator,
                const BodyParameters& body) -> Result<std::unique_ptr<CommandHandler>>;

    /// Registered commands in declaration order.
    [[nodiscard]] auto commands() const -> std::vector<Command>;

protected:
    virtual void add_handlers() = 0;

    /// Map `command` to `constructor`; a later registration replaces an
    /// earlier one. Only call from `add_handlers`.
    void register_handler(Command command, HandlerConstructor constructor);

private:
    sessions::SessionStore& sessions_;
    std::unordered_map<Command, HandlerConstructor> handlers_;
    std::mutex construction_mutex_;
    bool initialized_ = false;
};

} // namespace wdserver::commands
