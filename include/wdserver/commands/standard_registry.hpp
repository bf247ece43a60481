#pragma once

#include "wdserver/commands/registry.hpp"

namespace wdserver::commands {

/// The default server flavor: session management, window, navigation and
/// mouse commands.
class StandardCommandRegistry : public CommandRegistry {
public:
    using CommandRegistry::CommandRegistry;

protected:
    void add_handlers() override;
};

} // namespace wdserver::commands
