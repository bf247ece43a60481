#include "wdserver/core/config.hpp"
#include "wdserver/core/logger.hpp"
#include "wdserver/core/utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace wdserver {

auto load_config(const std::filesystem::path& path) -> ServerConfig {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // Registrations without a type descriptor can never succeed.
        if (j.contains("drivers") && j["drivers"].is_array()) {
            auto& drivers = j["drivers"];
            for (auto it = drivers.begin(); it != drivers.end(); ) {
                if (!it->is_object() || it->value("type", "").empty()) {
                    LOG_WARN("Config: ignoring driver entry without a type: {}", it->dump());
                    it = drivers.erase(it);
                } else {
                    ++it;
                }
            }
        }

        auto config = j.get<ServerConfig>();
        if (config.worker_threads == 0) {
            LOG_WARN("Config: worker_threads must be positive, using 1");
            config.worker_threads = 1;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> ServerConfig {
    ServerConfig config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(ServerConfig& config) {
    if (auto* val = std::getenv("WDSERVER_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("WDSERVER_DRIVER_DIR")) {
        config.driver_library_dir = val;
    }
    if (auto* val = std::getenv("WDSERVER_WORKER_THREADS")) {
        std::string_view text(val);
        std::size_t threads = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), threads);
        if (ec == std::errc{} && ptr == text.data() + text.size() && threads > 0) {
            config.worker_threads = threads;
        } else {
            LOG_WARN("Ignoring invalid WDSERVER_WORKER_THREADS value '{}'", text);
        }
    }
}

auto default_config() -> ServerConfig {
    return ServerConfig{};
}

auto default_driver_library_dir() -> std::filesystem::path {
    return utils::executable_dir() / kDriverLibraryDirName;
}

auto resolve_driver_library_dir(const ServerConfig& config) -> std::filesystem::path {
    if (config.driver_library_dir && !config.driver_library_dir->empty()) {
        return *config.driver_library_dir;
    }
    return default_driver_library_dir();
}

} // namespace wdserver
