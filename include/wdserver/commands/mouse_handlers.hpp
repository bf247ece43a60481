#pragma once

#include <memory>
#include <string>

#include "wdserver/commands/handler.hpp"

namespace wdserver::commands {

/// Button code of the primary mouse button in `button` body parameters.
inline constexpr int kPrimaryMouseButton = 0;

/// Base for handlers acting on the session driver's mouse. Drivers without
/// input devices fail with UnsupportedOperation.
class MouseCommandHandler : public SessionCommandHandler {
public:
    using SessionCommandHandler::SessionCommandHandler;

protected:
    auto execute_with(drivers::Driver& driver) -> Result<json> final;
    virtual auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult = 0;
};

/// `mouseClick`: click at the last pointer position. Button 0 (the
/// default) is a primary click, any other button a context click.
class MouseClickHandler : public MouseCommandHandler {
public:
    MouseClickHandler(const HandlerContext& context, int button);

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;
    [[nodiscard]] auto is_primary_click() const -> bool { return primary_; }

protected:
    auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult override;

private:
    bool primary_ = true;
};

class MouseDoubleClickHandler : public MouseCommandHandler {
public:
    using MouseCommandHandler::MouseCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult override;
};

class MouseDownHandler : public MouseCommandHandler {
public:
    using MouseCommandHandler::MouseCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult override;
};

class MouseUpHandler : public MouseCommandHandler {
public:
    using MouseCommandHandler::MouseCommandHandler;

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult override;
};

/// `mouseMoveTo`: move the pointer by `xoffset`/`yoffset` (default 0).
class MouseMoveToHandler : public MouseCommandHandler {
public:
    MouseMoveToHandler(const HandlerContext& context, int x_offset, int y_offset);

    static auto create(const HandlerContext& context) -> Result<std::unique_ptr<CommandHandler>>;

    [[nodiscard]] auto describe() const -> std::string override;

protected:
    auto execute_with_mouse(drivers::Mouse& mouse) -> VoidResult override;

private:
    int x_offset_ = 0;
    int y_offset_ = 0;
};

} // namespace wdserver::commands
