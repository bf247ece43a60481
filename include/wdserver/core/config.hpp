#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "wdserver/core/types.hpp"

// std::optional serializer for nlohmann/json so optional fields round-trip
// through the NLOHMANN_DEFINE macros.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace wdserver {

/// One driver registration performed at startup.
struct DriverRegistrationConfig {
    json capabilities = json::object();
    std::string type;  // "TypeName" or "TypeName, ModuleName"
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DriverRegistrationConfig, capabilities, type)

struct ServerConfig {
    std::string log_level = "info";
    std::optional<std::string> driver_library_dir;  // default: <exe dir>/DriverLibraries
    std::size_t worker_threads = 4;
    std::vector<DriverRegistrationConfig> drivers;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, log_level, driver_library_dir, worker_threads, drivers)

/// Name of the directory, beside the executable, searched for driver modules.
inline constexpr const char* kDriverLibraryDirName = "DriverLibraries";

auto load_config(const std::filesystem::path& path) -> ServerConfig;
auto load_config_from_env() -> ServerConfig;
/// Overwrite fields of `config` with any WDSERVER_* environment variables set.
void apply_env_overrides(ServerConfig& config);
auto default_config() -> ServerConfig;
auto default_driver_library_dir() -> std::filesystem::path;

/// Returns the configured driver library directory, or the default one.
auto resolve_driver_library_dir(const ServerConfig& config) -> std::filesystem::path;

} // namespace wdserver
