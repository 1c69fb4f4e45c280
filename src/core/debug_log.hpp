#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string kuberun_log_path() {
    static std::string path = (platform::temp_dir() / "kuberun_debug.log").string();
    return path;
}

inline void kuberun_log(const std::string& msg) {
    std::ofstream out(kuberun_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log a kubectl invocation and its outcome
inline void kuberun_log_cmd(const std::string& label, const std::string& cmd, int exit_code) {
    kuberun_log(fmt::format("{} CMD: {}", label, cmd));
    kuberun_log(fmt::format("{} exit={}", label, exit_code));
}
