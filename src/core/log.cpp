#include "log.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>

namespace {

LogLevel g_min_level = LogLevel::Info;
std::string g_file_path;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

void log_init(LogLevel min_level, const std::string& file_path) {
    g_min_level = min_level;
    g_file_path = file_path;
}

LogLevel log_level() {
    return g_min_level;
}

void slurmled_log(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level)) return;

    std::string line = fmt::format("{} [{}] {}\n", timestamp(), level_name(level), msg);
    std::cerr << line << std::flush;

    if (!g_file_path.empty()) {
        std::ofstream out(g_file_path, std::ios::app);
        if (out) out << line;
    }
}
