#pragma once

#include <memory>
#include <string>

#include "wdserver/commands/handler.hpp"

namespace wdserver::commands {

/// `status`: server readiness and the number of active sessions.
class StatusHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    auto execute() -> Result<json> override;
    [[nodiscard]] auto describe() const -> std::string override;
};

/// `newSession`: starts a driver for the `desiredCapabilities` body
/// parameter and returns `{"sessionId", "capabilities"}`.
class NewSessionHandler : public CommandHandler {
public:
    NewSessionHandler(const HandlerContext& context, json desired_capabilities);

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    auto execute() -> Result<json> override;
    [[nodiscard]] auto describe() const -> std::string override;

private:
    json desired_capabilities_;
};

/// `getSessions`: every active session with its capabilities.
class GetSessionsHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    auto execute() -> Result<json> override;
    [[nodiscard]] auto describe() const -> std::string override;
};

/// `quit`: ends the browser session and removes it from the store. The
/// session is removed even when the driver reports a failure on quit.
class QuitHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    auto execute() -> Result<json> override;
    [[nodiscard]] auto describe() const -> std::string override;
};

} // namespace wdserver::commands
