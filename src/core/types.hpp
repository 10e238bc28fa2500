#pragma once

#include <string>
#include <optional>
#include <vector>
#include <chrono>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one finished child process (tmux invocation)
struct ProcessResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Which part of a pane capture-pane should render
enum class CaptureScope {
    Visible,    // one screenful
    History,    // entire scrollback plus visible region
};

// Result of a marker-synchronized command
struct CommandResult {
    std::string output;
    std::optional<int> exit_code;       // set when the end marker reported $?
    std::chrono::milliseconds elapsed{0};
};

// Configuration structures
struct TmuxSettings {
    std::string binary = "tmux";
    std::string socket_name;            // tmux -L
    std::string socket_path;            // tmux -S
    int command_timeout_ms = 10000;     // OS-level limit per tmux invocation
};

struct ExecuteSettings {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds poll_interval{250};
    bool exit_status = true;
};
