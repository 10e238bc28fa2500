#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include <core/config.hpp>
#include <tmux/pane_transport.hpp>
#include <tmux/tmux_controller.hpp>

// Subcommands of the tmuxbridge binary. Each returns the process exit code;
// SessionNotFoundError, CommandTimeoutError and TransportError propagate to
// main(), which maps them to exit codes.
class BridgeCLI {
public:
    explicit BridgeCLI(const Config& config);
    BridgeCLI(std::shared_ptr<PaneTransport> transport, ControllerOptions options);

    int run_sessions();
    int run_exec(const std::string& target, const std::string& command,
                 std::optional<std::chrono::milliseconds> timeout);
    int run_send(const std::string& target, const std::string& text, bool enter);
    int run_read(const std::string& target, std::optional<size_t> lines);

    // Guided walk-through against a live session.
    int run_demo(const std::string& target);

    // Write the commented default config to path unless a file is already there.
    static int run_init(const fs::path& path);

private:
    TmuxController attach(const std::string& target);

    std::shared_ptr<PaneTransport> transport_;
    ControllerOptions options_;
};
