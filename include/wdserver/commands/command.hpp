#pragma once

#include <optional>
#include <span>
#include <string_view>

namespace wdserver::commands {

/// Closed set of protocol commands understood by the dispatcher. Values
/// carry the JSON wire protocol names returned by `to_string`.
enum class Command {
    Status,
    NewSession,
    GetSessions,
    Quit,
    GetWindowHandles,
    GetCurrentWindowHandle,
    Close,
    Get,
    GetCurrentUrl,
    GetTitle,
    Refresh,
    GoBack,
    GoForward,
    Screenshot,
    GetPageSource,
    FindElement,
    FindElements,
    ExecuteScript,
    SendKeysToActiveElement,
    MouseClick,
    MouseDoubleClick,
    MouseDown,
    MouseUp,
    MouseMoveTo,
};

[[nodiscard]] auto to_string(Command command) -> std::string_view;

/// Parse a wire name; nullopt for names outside the protocol.
[[nodiscard]] auto command_from_string(std::string_view name) -> std::optional<Command>;

/// Every command, in declaration order.
[[nodiscard]] auto all_commands() -> std::span<const Command>;

} // namespace wdserver::commands
