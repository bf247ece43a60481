#include "wdserver/commands/mouse_handlers.hpp"

namespace wdserver::commands {

auto MouseCommandHandler::execute_with(drivers::Driver& driver) -> Result<json> {
    auto* input = dynamic_cast<drivers::HasInputDevices*>(&driver);
    if (!input) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedOperation,
            "Driver has no input devices",
            describe()));
    }

    auto result = execute_with_mouse(input->mouse());
    if (!result) {
        return std::unexpected(result.error());
    }
    return json(nullptr);
}

MouseClickHandler::MouseClickHandler(const HandlerContext& context, int button)
    : MouseCommandHandler(context), primary_(button == kPrimaryMouseButton) {}

auto MouseClickHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    auto button = optional_int(context.body, "button", kPrimaryMouseButton);
    if (!button) {
        return std::unexpected(button.error());
    }
    return std::make_unique<MouseClickHandler>(context, *button);
}

auto MouseClickHandler::describe() const -> std::string {
    return "[click mouse]";
}

auto MouseClickHandler::execute_with_mouse(drivers::Mouse& mouse) -> VoidResult {
    if (primary_) {
        return mouse.click();
    }
    return mouse.context_click();
}

auto MouseDoubleClickHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<MouseDoubleClickHandler>(context);
}

auto MouseDoubleClickHandler::describe() const -> std::string {
    return "[double-click mouse]";
}

auto MouseDoubleClickHandler::execute_with_mouse(drivers::Mouse& mouse) -> VoidResult {
    return mouse.double_click();
}

auto MouseDownHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<MouseDownHandler>(context);
}

auto MouseDownHandler::describe() const -> std::string {
    return "[mouse button down]";
}

auto MouseDownHandler::execute_with_mouse(drivers::Mouse& mouse) -> VoidResult {
    return mouse.button_down();
}

auto MouseUpHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    return std::make_unique<MouseUpHandler>(context);
}

auto MouseUpHandler::describe() const -> std::string {
    return "[mouse button up]";
}

auto MouseUpHandler::execute_with_mouse(drivers::Mouse& mouse) -> VoidResult {
    return mouse.button_up();
}

MouseMoveToHandler::MouseMoveToHandler(const HandlerContext& context, int x_offset, int y_offset)
    : MouseCommandHandler(context), x_offset_(x_offset), y_offset_(y_offset) {}

auto MouseMoveToHandler::create(const HandlerContext& context)
    -> Result<std::unique_ptr<CommandHandler>> {
    auto x = optional_int(context.body, "xoffset", 0);
    if (!x) {
        return std::unexpected(x.error());
    }
    auto y = optional_int(context.body, "yoffset", 0);
    if (!y) {
        return std::unexpected(y.error());
    }
    return std::make_unique<MouseMoveToHandler>(context, *x, *y);
}

auto MouseMoveToHandler::describe() const -> std::string {
    return "[move mouse by " + std::to_string(x_offset_) + "," + std::to_string(y_offset_) + "]";
}

auto MouseMoveToHandler::execute_with_mouse(drivers::Mouse& mouse) -> VoidResult {
    return mouse.move_by(x_offset_, y_offset_);
}

} // namespace wdserver::commands
