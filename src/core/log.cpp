#include "log.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;
static std::string g_log_path;
static bool g_log_echo = false;

std::string ktest_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / LOG_FILE_NAME).string();
    }
    return g_log_path;
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void set_log_echo(bool echo) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_echo = echo;
}

void ktest_log(const std::string& level, const std::string& msg) {
    std::string path = ktest_log_path();

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    std::string line = fmt::format("[{}] {} {}", ts, level, msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_echo) {
        std::cerr << line << "\n";
    }
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << line << "\n";
}
