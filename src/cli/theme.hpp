#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI colours for the CLI's own output (never sent to a pane)
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header: blank line before title and after
inline std::string section(const std::string& title) {
    return "\n" + color::BLUE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::YELLOW + "    > " + color::RESET + msg + "\n";
}

// One line of captured pane text, fenced so it reads apart from CLI chatter
inline std::string pane_line(const std::string& line) {
    return color::DIM + "    | " + color::RESET + line + "\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
