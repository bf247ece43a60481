#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "wdserver/core/config.hpp"

namespace wdserver::cli {

/// Work selected by a subcommand; runs once the configuration is loaded.
using CommandAction = std::function<int(const ServerConfig&)>;

/// Register the `version` subcommand.
void register_version_command(CLI::App& app, CommandAction& action);

/// Register the `commands` subcommand.
/// Lists every protocol command and whether the server handles it.
void register_commands_command(CLI::App& app, CommandAction& action);

/// Register the `drivers` subcommand.
/// Registers the configured drivers and reports the ones that failed.
void register_drivers_command(CLI::App& app, CommandAction& action);

} // namespace wdserver::cli
