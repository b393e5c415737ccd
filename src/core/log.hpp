#pragma once

#include <string>
#include <fmt/format.h>

// Append-only daemon log. Lines look like:
//   [2026-10-18T19:20:01.123] INFO  pool: reusing connection to ci@build:22
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct LogSettings {
    std::string path;              // empty = <tmp>/shellpoold.log
    LogLevel level = LogLevel::Info;
    bool mirror_stderr = false;
};

// Replace the process-wide log settings. Safe to call at any time.
void configure_logging(const LogSettings& settings);

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
bool parse_log_level(const std::string& name, LogLevel& out);

bool log_enabled(LogLevel level);

void sp_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { sp_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { sp_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { sp_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { sp_log(LogLevel::Error, msg); }
