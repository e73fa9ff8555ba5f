#pragma once

#include <string>

// Debug log: timestamped lines appended to <tmp>/ktest_debug.log unless
// redirected with set_log_path().
std::string ktest_log_path();
void set_log_path(const std::string& path);

// Also write every line to stderr (CLI --verbose style output)
void set_log_echo(bool echo);

void ktest_log(const std::string& level, const std::string& msg);

inline void log_info(const std::string& msg) { ktest_log("INFO", msg); }
inline void log_warn(const std::string& msg) { ktest_log("WARN", msg); }
