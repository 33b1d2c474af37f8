#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Partition colors on the hardware, reused for terminal output
namespace color {
    const std::string GREEN_HW  = "\033[38;2;0;255;0m";
    const std::string BLUE_HW   = "\033[38;2;0;150;255m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::BOLD + "  " + color::GREEN_HW + "slurm" + color::BLUE_HW + "led"
         + color::RESET + color::DIM + "  v" SLURMLED_VERSION "\n"
         + "  SLURM activity on LEDs" + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::GRAY + "    > " + color::RESET + msg + "\n";
}

// Command + description row for usage text
inline std::string usage_row(const std::string& cmd, const std::string& desc) {
    return color::BOLD + fmt::format("    {:<24}", cmd) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
