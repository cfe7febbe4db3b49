#include "../include/log.hpp"
#include "../include/util.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_out_mtx;
}

LogLevel parse_log_level(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v == "debug") return LogLevel::Debug;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

void init_logging_from_env() {
    set_log_level(parse_log_level(getenv_or("LOG_LEVEL", "info")));
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::string line = utc_timestamp() + " [" + tag + "] " + message + "\n";
    std::lock_guard<std::mutex> lock(g_out_mtx);
    if (level >= LogLevel::Warn) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}
