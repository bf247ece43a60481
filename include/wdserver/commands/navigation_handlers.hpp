#pragma once

#include <memory>
#include <string>

#include "wdserver/commands/handler.hpp"

namespace wdserver::commands {

/// `get`: navigate to the `url` body parameter.
class NavigateHandler : public SessionCommandHandler {
public:
    NavigateHandler(const HandlerContext& context, std::string url);

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> override;

private:
    std::string url_;
};

class GetCurrentUrlHandler : public SessionCommandHandler {
public:
    using SessionCommandHandler::SessionCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> override;
};

class GetTitleHandler : public SessionCommandHandler {
public:
    using SessionCommandHandler::SessionCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> override;
};

} // namespace wdserver::commands
