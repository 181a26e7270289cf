#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "fleet_debug.log").string();
    return path;
}

std::string fleet_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_fleet_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void fleet_log(const std::string& msg) {
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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void fleet_log_ssh(const std::string& label, const std::string& cmd,
                   const SSHResult& r) {
    fleet_log(fmt::format("{} CMD: {}", label, cmd));
    fleet_log(fmt::format("{} exit={} signal={} stdout({})={}", label, r.exit_code,
                          r.exit_signal.empty() ? "-" : r.exit_signal,
                          r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        fleet_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
