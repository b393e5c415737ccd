#include "log.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
LogSettings g_settings;
std::ofstream g_out;
bool g_opened = false;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO ";
}

std::string log_path() {
    if (!g_settings.path.empty()) return g_settings.path;
    return (platform::temp_dir() / "shellpoold.log").string();
}

// Caller holds g_log_mutex.
void ensure_open() {
    if (g_opened) return;
    g_opened = true;
    g_out.open(log_path(), std::ios::app);
}

} // namespace

void configure_logging(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_settings = settings;
    if (g_out.is_open()) g_out.close();
    g_opened = false;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    return false;
}

bool log_enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return static_cast<int>(level) >= static_cast<int>(g_settings.level);
}

void sp_log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    std::string line = fmt::format("[{}.{:03d}] {} {}\n", ts,
                                   static_cast<int>(ms.count()), level_tag(level), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_settings.level)) return;
    ensure_open();
    if (g_out) {
        g_out << line;
        g_out.flush();
    }
    if (g_settings.mirror_stderr) std::cerr << line;
}
