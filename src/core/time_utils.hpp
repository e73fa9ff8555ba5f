#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// Format an elapsed duration for log lines.
// Returns "450ms" under a second, then "45s", "5m30s", "2h15m".
std::string format_elapsed(std::chrono::steady_clock::duration elapsed);

// Elapsed time since `start`, formatted as above
std::string format_since(std::chrono::steady_clock::time_point start);

// Human-readable byte count in SI units: "512 B", "1.5 kB", "20 MB".
std::string format_bytes(std::uint64_t bytes);
