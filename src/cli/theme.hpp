#pragma once

#include <algorithm>
#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage_row(const std::string& cmd, const std::string& args,
                             const std::string& desc) {
    return color::BLUE + "    fleet " + cmd + color::RESET
         + (args.empty() ? "" : " " + color::BROWN + args + color::RESET)
         + color::DIM + std::string(static_cast<size_t>(std::max<int>(2, 30 - static_cast<int>(cmd.size() + args.size()))), ' ')
         + desc + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

// Transfer progress, redrawn in place with '\r'
inline std::string progress(const std::string& label, double fraction) {
    int pct = static_cast<int>(fraction * 100.0 + 0.5);
    int filled = pct / 5;
    return fmt::format("\r    {} [{}{}] {:>3}%", label,
                       std::string(static_cast<size_t>(filled), '#'),
                       std::string(static_cast<size_t>(20 - filled), '.'), pct);
}

} // namespace theme
