#include "wdserver/cli/app.hpp"
#include "wdserver/core/logger.hpp"

#include <filesystem>

namespace wdserver::cli {

App::App()
    : cli_("wdserver", "WebDriver remote server")
{
    cli_.set_version_flag("--version", WDSERVER_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("WDSERVER_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("WDSERVER_LOG_LEVEL");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    load_configuration();
    Logger::init("wdserver", config_.log_level);

    if (!action_) {
        return 0;
    }
    return action_(config_);
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const ServerConfig& {
    return config_;
}

void App::setup_commands() {
    register_version_command(cli_, action_);
    register_commands_command(cli_, action_);
    register_drivers_command(cli_, action_);
}

void App::load_configuration() {
    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
        apply_env_overrides(config_);
    } else {
        config_ = load_config_from_env();
    }

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
}

} // namespace wdserver::cli
