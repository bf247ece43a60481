#include "wdserver/commands/session_handlers.hpp"

#include "wdserver/core/logger.hpp"

namespace wdserver::commands {

auto StatusHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<StatusHandler>(context);
}

auto StatusHandler::execute() -> Result<json> {
    return json{
        {"ready", true},
        {"sessions", sessions().size()},
    };
}

auto StatusHandler::describe() const -> std::string {
    return "[server status]";
}

NewSessionHandler::NewSessionHandler(const HandlerContext& context, json desired_capabilities)
    : CommandHandler(context), desired_capabilities_(std::move(desired_capabilities)) {}

auto NewSessionHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    auto capabilities = require_object(context.body, "desiredCapabilities");
    if (!capabilities) {
        return std::unexpected(capabilities.error());
    }
    return std::make_unique<NewSessionHandler>(context, std::move(*capabilities));
}

auto NewSessionHandler::execute() -> Result<json> {
    auto id = sessions().create_session(desired_capabilities_);
    if (!id) {
        return std::unexpected(id.error());
    }

    return json{
        {"sessionId", *id},
        {"capabilities", desired_capabilities_},
    };
}

auto NewSessionHandler::describe() const -> std::string {
    return "[new session: " + desired_capabilities_.dump() + "]";
}

auto GetSessionsHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<GetSessionsHandler>(context);
}

auto GetSessionsHandler::execute() -> Result<json> {
    auto result = json::array();
    for (const auto& session : sessions().list_sessions()) {
        result.push_back(json{
            {"id", session->id()},
            {"capabilities", session->capabilities()},
        });
    }
    return result;
}

auto GetSessionsHandler::describe() const -> std::string {
    return "[get sessions]";
}

auto QuitHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<QuitHandler>(context);
}

auto QuitHandler::execute() -> Result<json> {
    auto session = resolve_session();
    if (!session) {
        return std::unexpected(session.error());
    }

    // Closing under the execution lock keeps handlers that resolved the
    // session earlier from reaching the driver after quit().
    auto quit = (*session)->close_with([](drivers::Driver& driver) {
        return driver.quit();
    });
    sessions().remove_session((*session)->id());

    if (!quit) {
        LOG_WARN("Driver reported an error while quitting session {}: {}",
                 (*session)->id(), quit.error().what());
        return std::unexpected(quit.error());
    }
    return json(nullptr);
}

auto QuitHandler::describe() const -> std::string {
    return "[quit session]";
}

} // namespace wdserver::commands
