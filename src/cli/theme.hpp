#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BLUE + "    > " + color::RESET + msg + "\n";
}

// Usage row: command, then a dimmed description
inline std::string usage(const std::string& cmd, const std::string& desc) {
    return color::BLUE + fmt::format("    {:<40}", cmd) + color::RESET + dim(desc) + "\n";
}

} // namespace theme
