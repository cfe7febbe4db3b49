#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Reads LOG_LEVEL (debug|info|warn|error); defaults to info.
void init_logging_from_env();
void set_log_level(LogLevel level);
LogLevel parse_log_level(const std::string& s);

// Writes "<timestamp> [tag] message" as one line. Warn and Error go to stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& m) { log_line(LogLevel::Debug, tag, m); }
inline void log_info(const std::string& tag, const std::string& m) { log_line(LogLevel::Info, tag, m); }
inline void log_warn(const std::string& tag, const std::string& m) { log_line(LogLevel::Warn, tag, m); }
inline void log_error(const std::string& tag, const std::string& m) { log_line(LogLevel::Error, tag, m); }
