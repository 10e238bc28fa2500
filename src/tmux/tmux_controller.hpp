#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include "pane_transport.hpp"

struct ControllerOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds poll_interval{250};
    bool exit_status = true;
    std::function<std::string()> marker_id_source;   // empty: random ids

    static ControllerOptions from_settings(const ExecuteSettings& s) {
        ControllerOptions o;
        o.timeout = s.timeout;
        o.poll_interval = s.poll_interval;
        o.exit_status = s.exit_status;
        return o;
    }
};

// Caller-facing handle on one tmux target (session[:window[.pane]]).
//
// Construction verifies the session is live and throws SessionNotFoundError
// otherwise. Calls are synchronous; the target pane is shared with whoever
// else types into it, so callers must not overlap execute calls on the same
// target, and interleaved human input inside a command's output is returned
// as part of that output.
class TmuxController {
public:
    TmuxController(std::string target, std::shared_ptr<PaneTransport> transport,
                   ControllerOptions options = {});

    // Run command in the pane and return what it printed.
    // Throws CommandTimeoutError if it does not finish within timeout (or the
    // controller default); the controller remains usable afterwards.
    std::string execute_and_wait(const std::string& command,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Same as execute_and_wait, also reporting exit status and elapsed time.
    CommandResult execute(const std::string& command,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Unsynchronized input, e.g. answering a prompt or sending a control key.
    void send_keys(const std::string& text, bool enter = true);

    // Visible region of the pane with escapes stripped; only the last `lines`
    // lines when given.
    std::string read_buffer(std::optional<size_t> lines = std::nullopt);

    static std::vector<std::string> list_sessions(PaneTransport& transport);

    const std::string& target() const { return target_; }
    std::string session_name() const { return target_.substr(0, target_.find(':')); }
    const ControllerOptions& options() const { return options_; }

private:
    std::string target_;
    std::shared_ptr<PaneTransport> transport_;
    ControllerOptions options_;
};
