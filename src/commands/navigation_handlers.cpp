#include "wdserver/commands/navigation_handlers.hpp"

namespace wdserver::commands {

NavigateHandler::NavigateHandler(const HandlerContext& context, std::string url)
    : SessionCommandHandler(context), url_(std::move(url)) {}

auto NavigateHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    auto url = require_string(context.body, "url");
    if (!url) {
        return std::unexpected(url.error());
    }
    if (url->empty()) {
        return std::unexpected(make_error(
            ErrorCode::HandlerConstructionFailed,
            "Parameter must not be empty",
            "url"));
    }
    return std::make_unique<NavigateHandler>(context, std::move(*url));
}

auto NavigateHandler::describe() const -> std::string {
    return "[navigate to: " + url_ + "]";
}

auto NavigateHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto result = driver.navigate(url_);
    if (!result) {
        return std::unexpected(result.error());
    }
    return json(nullptr);
}

auto GetCurrentUrlHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<GetCurrentUrlHandler>(context);
}

auto GetCurrentUrlHandler::describe() const -> std::string {
    return "[get current url]";
}

auto GetCurrentUrlHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto url = driver.current_url();
    if (!url) {
        return std::unexpected(url.error());
    }
    return json(*url);
}

auto GetTitleHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<GetTitleHandler>(context);
}

auto GetTitleHandler::describe() const -> std::string {
    return "[get title]";
}

auto GetTitleHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto title = driver.title();
    if (!title) {
        return std::unexpected(title.error());
    }
    return json(*title);
}

} // namespace wdserver::commands
