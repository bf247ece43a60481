#include "wdserver/cli/commands.hpp"
#include "wdserver/core/logger.hpp"

#include <iostream>
#include <string>
#include <string_view>

#include "wdserver/commands/command.hpp"
#include "wdserver/server/context.hpp"

namespace wdserver::cli {

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&action]() {
        action = [](const ServerConfig&) {
            std::cout << "wdserver " << WDSERVER_VERSION_STRING << "\n";
            std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
            std::cout << "Compiler: clang " << __clang_major__ << "."
                      << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
            std::cout << "Compiler: gcc " << __GNUC__ << "."
                      << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
            std::cout << "Compiler: unknown\n";
#endif
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// commands command
// ---------------------------------------------------------------------------

void register_commands_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("commands", "List protocol commands and their support");

    sub->add_flag("--supported", "Only list supported commands");

    sub->callback([&action, sub]() {
        bool supported_only = sub->count("--supported") > 0;
        action = [supported_only](const ServerConfig& config) {
            server::ServerContext context(config);
            auto& registry = context.commands();

            for (auto command : commands::all_commands()) {
                bool supported = registry.can_handle(command);
                if (supported_only && !supported) {
                    continue;
                }
                std::cout << commands::to_string(command)
                          << (supported ? "\tsupported" : "\tunsupported") << "\n";
            }
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// drivers command
// ---------------------------------------------------------------------------

void register_drivers_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("drivers", "Register configured drivers and report failures");

    sub->callback([&action]() {
        action = [](const ServerConfig& config) {
            server::ServerContext context(config);
            std::cout << "Driver libraries: " << context.drivers().library_dir().string() << "\n";

            std::size_t failures = 0;
            auto registered = context.register_configured_drivers(
                [&failures](std::string_view descriptor, const Error& error) {
                    ++failures;
                    std::cerr << "Failed to register '" << descriptor << "': " << error.what() << "\n";
                });

            std::cout << "Registered " << registered << " of " << config.drivers.size()
                      << " driver(s)\n";
            for (const auto& name : context.modules().loaded_names()) {
                std::cout << "  module " << name << "\n";
            }

            if (failures > 0) {
                LOG_ERROR("{} driver registration(s) failed", failures);
                return 1;
            }
            return 0;
        };
    });
}

} // namespace wdserver::cli
