#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

// Configure the process-wide logger. Lines always go to stderr; when
// file_path is non-empty they are also appended there.
void log_init(LogLevel min_level, const std::string& file_path = "");

LogLevel log_level();

// Emit one timestamped line: "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] msg"
void slurmled_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { slurmled_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { slurmled_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { slurmled_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { slurmled_log(LogLevel::Error, msg); }

inline void log_command(const std::string& label, const std::string& cmd, int exit_code,
                        const std::string& out, const std::string& err) {
    if (log_level() != LogLevel::Debug) return;
    log_debug(fmt::format("{} CMD: {}", label, cmd));
    log_debug(fmt::format("{} exit={} stdout({})={}", label, exit_code,
                          out.size(), out.substr(0, 500)));
    if (!err.empty())
        log_debug(fmt::format("{} stderr={}", label, err.substr(0, 500)));
}
