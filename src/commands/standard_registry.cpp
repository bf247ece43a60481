#include "wdserver/commands/standard_registry.hpp"

#include "wdserver/commands/mouse_handlers.hpp"
#include "wdserver/commands/navigation_handlers.hpp"
#include "wdserver/commands/session_handlers.hpp"
#include "wdserver/commands/window_handlers.hpp"

namespace wdserver::commands {

void StandardCommandRegistry::add_handlers() {
    register_handler(Command::Status, &StatusHandler::create);
    register_handler(Command::NewSession, &NewSessionHandler::create);
    register_handler(Command::GetSessions, &GetSessionsHandler::create);
    register_handler(Command::Quit, &QuitHandler::create);

    register_handler(Command::GetWindowHandles, &GetAllWindowsHandler::create);
    register_handler(Command::GetCurrentWindowHandle, &GetCurrentWindowHandleHandler::create);

    register_handler(Command::Get, &NavigateHandler::create);
    register_handler(Command::GetCurrentUrl, &GetCurrentUrlHandler::create);
    register_handler(Command::GetTitle, &GetTitleHandler::create);

    register_handler(Command::MouseClick, &MouseClickHandler::create);
    register_handler(Command::MouseDoubleClick, &MouseDoubleClickHandler::create);
    register_handler(Command::MouseDown, &MouseDownHandler::create);
    register_handler(Command::MouseUp, &MouseUpHandler::create);
    register_handler(Command::MouseMoveTo, &MouseMoveToHandler::create);
}

} // namespace wdserver::commands
