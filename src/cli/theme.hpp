#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string brown(const std::string& s)  { return color::BROWN + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// Title line for --help
inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  soloist" + color::RESET
         + color::DIM + "  one leader, many followers" + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage(const std::string& cmd, const std::string& arg, const std::string& desc) {
    return color::BLUE + fmt::format("    {:<8}", cmd) + color::RESET
         + color::BROWN + fmt::format("{:<10}", arg) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
