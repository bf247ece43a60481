#include "wdserver/commands/registry.hpp"

#include "wdserver/core/logger.hpp"

namespace wdserver::commands {

CommandRegistry::CommandRegistry(sessions::SessionStore& sessions)
    : sessions_(sessions) {}

void CommandRegistry::initialize() {
    if (initialized_) {
        return;
    }
    add_handlers();
    initialized_ = true;
    LOG_INFO("Command registry initialized with {} handler(s)", handlers_.size());
}

auto CommandRegistry::can_handle(Command command) const -> bool {
    return handlers_.contains(command);
}

auto CommandRegistry::create(Command command,
                             const LocatorParameters& locator,
                             const BodyParameters& body)
    -> Result<std::unique_ptr<CommandHandler>> {
    static const BodyParameters kEmptyBody = json::object();
    HandlerContext context{
        .sessions = sessions_,
        .locator = locator,
        .body = body.is_null() ? kEmptyBody : body,
    };

    // Some handlers touch driver state while validating; keep construction
    // single-threaded.
    std::lock_guard lock(construction_mutex_);

    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        LOG_DEBUG("No handler for command '{}'", to_string(command));
        return std::make_unique<UnsupportedCommandHandler>(command, context);
    }

    auto handler = it->second(context);
    if (!handler) {
        LOG_DEBUG("Handler construction for '{}' failed: {}",
                  to_string(command), handler.error().what());
    }
    return handler;
}

auto CommandRegistry::commands() const -> std::vector<Command> {
    std::vector<Command> result;
    result.reserve(handlers_.size());
    for (auto command : all_commands()) {
        if (handlers_.contains(command)) {
            result.push_back(command);
        }
    }
    return result;
}

void CommandRegistry::register_handler(Command command, HandlerConstructor constructor) {
    if (!constructor) {
        LOG_WARN("Attempted to register a null constructor for '{}'", to_string(command));
        return;
    }

    if (handlers_.contains(command)) {
        LOG_WARN("Replacing handler for command: {}", to_string(command));
    } else {
        LOG_DEBUG("Registered handler for command: {}", to_string(command));
    }

    handlers_[command] = std::move(constructor);
}

} // namespace wdserver::commands
