#include "wdserver/commands/command.hpp"

#include <array>
#include <utility>

namespace wdserver::commands {

namespace {

constexpr std::array<std::pair<Command, std::string_view>, 24> kCommandNames = {{
    {Command::Status, "status"},
    {Command::NewSession, "newSession"},
    {Command::GetSessions, "getSessions"},
    {Command::Quit, "quit"},
    {Command::GetWindowHandles, "getWindowHandles"},
    {Command::GetCurrentWindowHandle, "getCurrentWindowHandle"},
    {Command::Close, "close"},
    {Command::Get, "get"},
    {Command::GetCurrentUrl, "getCurrentUrl"},
    {Command::GetTitle, "getTitle"},
    {Command::Refresh, "refresh"},
    {Command::GoBack, "goBack"},
    {Command::GoForward, "goForward"},
    {Command::Screenshot, "screenshot"},
    {Command::GetPageSource, "getPageSource"},
    {Command::FindElement, "findElement"},
    {Command::FindElements, "findElements"},
    {Command::ExecuteScript, "executeScript"},
    {Command::SendKeysToActiveElement, "sendKeysToActiveElement"},
    {Command::MouseClick, "mouseClick"},
    {Command::MouseDoubleClick, "mouseDoubleClick"},
    {Command::MouseDown, "mouseButtonDown"},
    {Command::MouseUp, "mouseButtonUp"},
    {Command::MouseMoveTo, "mouseMoveTo"},
}};

constexpr auto make_command_list() {
    std::array<Command, kCommandNames.size()> list{};
    for (std::size_t i = 0; i < kCommandNames.size(); ++i) {
        list[i] = kCommandNames[i].first;
    }
    return list;
}

constexpr auto kAllCommands = make_command_list();

} // anonymous namespace

auto to_string(Command command) -> std::string_view {
    for (const auto& [value, name] : kCommandNames) {
        if (value == command) return name;
    }
    return "unknown";
}

auto command_from_string(std::string_view name) -> std::optional<Command> {
    for (const auto& [value, wire_name] : kCommandNames) {
        if (wire_name == name) return value;
    }
    return std::nullopt;
}

auto all_commands() -> std::span<const Command> {
    return kAllCommands;
}

} // namespace wdserver::commands
