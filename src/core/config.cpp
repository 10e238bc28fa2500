#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cmath>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".tmuxbridge";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_active_config_path() {
    const char* override_path = std::getenv("TMUXBRIDGE_CONFIG");
    if (override_path && *override_path) {
        return fs::path(override_path);
    }
    return get_global_config_path();
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# tmuxbridge configuration

tmux:
  binary: "tmux"
  socket_name: ""          # tmux -L <name>
  socket_path: ""          # tmux -S <path>, wins over socket_name
  command_timeout_ms: 10000

execute:
  timeout: 30              # seconds to wait for a command's end marker
  poll_interval_ms: 250
  exit_status: true        # report $? after the end marker (POSIX shells)

# Debug log, defaults to <tmp>/tmuxbridge_debug.log
# log_file: ""
)";

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static TmuxSettings parse_tmux_config(const YAML::Node& node) {
    TmuxSettings tmux;
    tmux.binary = node["binary"].as<std::string>("tmux");
    tmux.socket_name = node["socket_name"].as<std::string>("");
    tmux.socket_path = node["socket_path"].as<std::string>("");
    tmux.command_timeout_ms = node["command_timeout_ms"].as<int>(TMUX_CMD_TIMEOUT_MS);
    return tmux;
}

static ExecuteSettings parse_execute_config(const YAML::Node& node) {
    ExecuteSettings exec;
    double timeout_secs = node["timeout"].as<double>(DEFAULT_EXEC_TIMEOUT_MS / 1000.0);
    exec.timeout = std::chrono::milliseconds(
        static_cast<long long>(std::llround(timeout_secs * 1000.0)));
    exec.poll_interval = std::chrono::milliseconds(
        node["poll_interval_ms"].as<int>(DEFAULT_POLL_INTERVAL_MS));
    exec.exit_status = node["exit_status"].as<bool>(true);
    return exec;
}

static Result<void> validate(const TmuxSettings& tmux, const ExecuteSettings& exec) {
    if (tmux.binary.empty()) {
        return Result<void>::Err("tmux.binary must not be empty");
    }
    if (tmux.command_timeout_ms < 0) {
        return Result<void>::Err("tmux.command_timeout_ms must not be negative");
    }
    if (exec.timeout.count() <= 0) {
        return Result<void>::Err("execute.timeout must be positive");
    }
    if (exec.poll_interval.count() <= 0) {
        return Result<void>::Err("execute.poll_interval_ms must be positive");
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("config root must be a mapping");
        }

        if (root["tmux"]) {
            config.tmux_ = parse_tmux_config(root["tmux"]);
        }
        if (root["execute"]) {
            config.execute_ = parse_execute_config(root["execute"]);
        }
        config.log_file_ = root["log_file"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    }

    auto valid = validate(config.tmux_, config.execute_);
    if (valid.is_err()) {
        return Result<Config>::Err(valid.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    return result;
}

Result<Config> Config::load_global() {
    return load_file(get_active_config_path());
}
