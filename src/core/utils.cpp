#include "wdserver/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <system_error>

#include <uuid.h>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#elif defined(_WIN32)
#include <windows.h>
#endif

namespace wdserver::utils {

namespace fs = std::filesystem;

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

auto executable_dir() -> fs::path {
#if defined(_WIN32)
    char buf[MAX_PATH];
    auto len = ::GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (len > 0 && len < MAX_PATH) {
        return fs::path(std::string(buf, len)).parent_path();
    }
#elif defined(__APPLE__)
    char buf[4096];
    uint32_t size = sizeof(buf);
    if (::_NSGetExecutablePath(buf, &size) == 0) {
        std::error_code ec;
        auto resolved = fs::weakly_canonical(fs::path(buf), ec);
        return (ec ? fs::path(buf) : resolved).parent_path();
    }
#else
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path();
    }
#endif
    std::error_code cwd_ec;
    auto cwd = fs::current_path(cwd_ec);
    return cwd_ec ? fs::path(".") : cwd;
}

} // namespace wdserver::utils
