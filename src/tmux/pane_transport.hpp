#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/types.hpp>
#include "command_runner.hpp"

// Minimal operation set for talking to a multiplexer target.
// Targets are "session", "session:window" or "session:window.pane" and are
// passed through unmodified. All failures to talk to the multiplexer throw
// TransportError.
class PaneTransport {
public:
    virtual ~PaneTransport() = default;

    // True iff the target names a live session. "No such session" and "no
    // server running" are false; an unreachable server socket throws.
    virtual bool session_exists(const std::string& target) = 0;

    // Type text literally into the target; if submit, press Enter afterwards.
    // Returns once tmux has accepted the keys, not once they were processed.
    virtual void send_keys(const std::string& target, const std::string& text,
                           bool submit) = 0;

    // Raw rendered pane text, escape sequences included if tmux emits any.
    virtual std::string capture(const std::string& target, CaptureScope scope) = 0;

    // Live session names in tmux's order; empty when no server is running.
    virtual std::vector<std::string> list_sessions() = 0;
};

class TmuxTransport : public PaneTransport {
public:
    explicit TmuxTransport(std::shared_ptr<CommandRunner> runner);

    bool session_exists(const std::string& target) override;
    void send_keys(const std::string& target, const std::string& text,
                   bool submit) override;
    std::string capture(const std::string& target, CaptureScope scope) override;
    std::vector<std::string> list_sessions() override;

    // tmux splits command sequences on an argument ending in ';'. Escape a
    // trailing ';' so literal text reaches the pane intact.
    static std::string escape_trailing_semicolon(const std::string& text);

private:
    // Run a subcommand; throws TransportError if tmux could not be run.
    ProcessResult invoke(const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
};
