#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wdserver::utils {

auto generate_uuid() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto iequals(std::string_view a, std::string_view b) -> bool;

/// Directory containing the running executable. Falls back to the current
/// working directory when the platform cannot report it.
auto executable_dir() -> std::filesystem::path;

} // namespace wdserver::utils
