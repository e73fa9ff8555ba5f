#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    long long seconds = ms / 1000;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_since(std::chrono::steady_clock::time_point start) {
    return format_elapsed(std::chrono::steady_clock::now() - start);
}

std::string format_bytes(std::uint64_t bytes) {
    static const char* UNITS[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};

    if (bytes < 1000) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1000.0 && unit < 6) {
        value /= 1000.0;
        unit++;
    }
    // One decimal below 10 ("1.5 kB"), none above ("20 MB")
    if (value < 10.0) {
        return fmt::format("{:.1f} {}", value, UNITS[unit]);
    }
    return fmt::format("{:.0f} {}", value, UNITS[unit]);
}
