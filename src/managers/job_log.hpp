#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string vmig_log_path() {
    static std::string path = (platform::temp_dir() / "vmig_debug.log").string();
    return path;
}

// Append a "[HH:MM:SS.mmm] msg" line to the debug log. Job threads call this
// concurrently, so writes are serialized.
inline void vmig_log(const std::string& msg) {
    static std::mutex log_mutex;

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

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(vmig_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

// Debug-log line tagged with the job it belongs to.
inline void vmig_log_job(const std::string& job_id, const std::string& msg) {
    vmig_log(fmt::format("[job {}] {}", job_id.substr(0, 8), msg));
}
