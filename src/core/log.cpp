#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "tmuxbridge_debug.log").string();
    return path;
}

std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n'\"") == std::string::npos) return arg;
    return fmt::format("'{}'", arg);
}

} // namespace

std::string bridge_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_bridge_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void bridge_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void bridge_log_process(const std::string& label,
                        const std::vector<std::string>& argv,
                        const ProcessResult& r) {
    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += quote_arg(a);
    }
    bridge_log(fmt::format("{} CMD: {}", label, cmd));
    bridge_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW)));
    if (!r.stderr_data.empty())
        bridge_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW)));
}
