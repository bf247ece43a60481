#pragma once

#include <memory>
#include <string>

#include "wdserver/commands/handler.hpp"

namespace wdserver::commands {

/// `getWindowHandles`: every window handle, in the order the driver reports.
class GetAllWindowsHandler : public SessionCommandHandler {
public:
    using SessionCommandHandler::SessionCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> override;
};

/// `getCurrentWindowHandle`
class GetCurrentWindowHandleHandler : public SessionCommandHandler {
public:
    using SessionCommandHandler::SessionCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> override;
};

} // namespace wdserver::commands
