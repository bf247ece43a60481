#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wdserver/commands/command.hpp"
#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"
#include "wdserver/drivers/driver.hpp"
#include "wdserver/sessions/session.hpp"
#include "wdserver/sessions/session_store.hpp"

namespace wdserver::commands {

/// Everything a handler constructor may read. Only valid for the duration
/// of the constructor call; handlers copy what they keep.
struct HandlerContext {
    sessions::SessionStore& sessions;
    const LocatorParameters& locator;
    const BodyParameters& body;
};

/// A single-use unit of work for one protocol command.
///
/// Handlers are built by their class's static `create`, which validates
/// parameters up front and fails with HandlerConstructionFailed rather than
/// producing a half-initialized handler. `execute` runs once, synchronously,
/// and its result is JSON null for commands without a value.
class CommandHandler {
public:
    explicit CommandHandler(const HandlerContext& context);
    virtual ~CommandHandler() = default;

    CommandHandler(const CommandHandler&) = delete;
    CommandHandler& operator=(const CommandHandler&) = delete;

    virtual auto execute() -> Result<json> = 0;

    /// Short, stable label for logs, e.g. "[get all window handles]".
    [[nodiscard]] virtual auto describe() const -> std::string = 0;

protected:
    [[nodiscard]] auto sessions() const -> sessions::SessionStore& { return sessions_; }
    [[nodiscard]] auto locator() const -> const LocatorParameters& { return locator_; }

    /// Look up the session named by the `sessionId` locator parameter.
    /// Fails with SessionNotFound when the parameter or the session is absent.
    auto resolve_session() const -> Result<std::shared_ptr<sessions::Session>>;

private:
    sessions::SessionStore& sessions_;
    LocatorParameters locator_;
};

/// Base for handlers that perform one action against a session's driver.
/// The action runs under the session's execution lock; driver errors are
/// returned unmodified.
class SessionCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    auto execute() -> Result<json> final;

protected:
    virtual auto execute_with(drivers::Driver& driver) -> Result<json> = 0;
};

/// Fallback for commands without a registered constructor.
class UnsupportedCommandHandler : public CommandHandler {
public:
    UnsupportedCommandHandler(Command command, const HandlerContext& context);

    auto execute() -> Result<json> override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto command() const -> Command { return command_; }

private:
    Command command_;
};

// Parameter readers for handler constructors. All fail with
// HandlerConstructionFailed, naming the offending key.

auto require_string(const BodyParameters& body, std::string_view key) -> Result<std::string>;
auto require_object(const BodyParameters& body, std::string_view key) -> Result<json>;

/// Integer parameter that may be absent, in which case `fallback` is used.
auto optional_int(const BodyParameters& body, std::string_view key, int fallback) -> Result<int>;

} // namespace wdserver::commands
