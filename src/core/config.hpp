#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load $TMUXBRIDGE_CONFIG, else ~/.tmuxbridge/config.yaml.
    // A missing file yields the defaults.
    static Result<Config> load_global();

    // Load a specific file. A missing file yields the defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml);

    // Accessors
    const TmuxSettings& tmux() const { return tmux_; }
    const ExecuteSettings& execute() const { return execute_; }
    const std::string& log_file() const { return log_file_; }

public:
    Config() = default;

private:
    TmuxSettings tmux_;
    ExecuteSettings execute_;
    std::string log_file_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// $TMUXBRIDGE_CONFIG when set, else get_global_config_path().
fs::path get_active_config_path();

// Write a commented default config; leaves an existing file alone.
Result<void> create_default_config(const fs::path& path = get_global_config_path());
