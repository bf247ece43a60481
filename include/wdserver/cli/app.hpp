#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "wdserver/cli/commands.hpp"
#include "wdserver/core/config.hpp"

namespace wdserver::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration and
/// then runs the selected subcommand (version, commands, drivers).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() const -> const ServerConfig&;

private:
    void setup_commands();
    void load_configuration();

    CLI::App cli_;
    ServerConfig config_;
    std::string config_path_;
    std::string log_level_;
    CommandAction action_;
};

} // namespace wdserver::cli
