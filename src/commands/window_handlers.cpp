#include "wdserver/commands/window_handlers.hpp"

namespace wdserver::commands {

auto GetAllWindowsHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<GetAllWindowsHandler>(context);
}

auto GetAllWindowsHandler::describe() const -> std::string {
    return "[get all window handles]";
}

auto GetAllWindowsHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto handles = driver.window_handles();
    if (!handles) {
        return std::unexpected(handles.error());
    }
    return json(*handles);
}

auto GetCurrentWindowHandleHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<GetCurrentWindowHandleHandler>(context);
}

auto GetCurrentWindowHandleHandler::describe() const -> std::string {
    return "[get current window handle]";
}

auto GetCurrentWindowHandleHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto handle = driver.current_window_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return json(*handle);
}

} // namespace wdserver::commands
