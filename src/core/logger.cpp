#include "wdserver/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wdserver {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    auto to_spdlog_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }

    void init_locked(std::string_view name, std::string_view level) {
        auto logger_name = std::string(name);
        // Re-initialising under the same name must not trip spdlog's duplicate check.
        spdlog::drop(logger_name);
        g_logger = spdlog::stdout_color_mt(logger_name);
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        g_logger->set_level(to_spdlog_level(level));
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_logger_mutex);
    init_locked(name, level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_logger_mutex);
    if (!g_logger) {
        init_locked("wdserver", "info");
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(to_spdlog_level(level));
}

void Logger::flush() {
    get()->flush();
}

} // namespace wdserver
