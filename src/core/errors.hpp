#pragma once

#include <string>
#include <chrono>
#include <stdexcept>
#include <fmt/format.h>

// Base for every condition the bridge reports to its caller.
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& msg) : std::runtime_error(msg) {}
};

// tmux could not be run, died, timed out, could not reach its server socket,
// or rejected a send/capture. Never retried.
class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& msg) : BridgeError(msg) {}
};

// Target session did not exist when the controller was constructed.
class SessionNotFoundError : public BridgeError {
public:
    explicit SessionNotFoundError(const std::string& target)
        : BridgeError(fmt::format(
              "tmux session '{}' not found. Create it first with: tmux new -s {}",
              target, target.substr(0, target.find(':')))),
          target_(target) {}

    const std::string& target() const { return target_; }

private:
    std::string target_;
};

// End marker not observed before the deadline, or observed without its start
// marker. The command may still be running in the pane; the controller stays
// usable.
class CommandTimeoutError : public BridgeError {
public:
    CommandTimeoutError(const std::string& command,
                        std::chrono::milliseconds timeout,
                        const std::string& detail = "")
        : BridgeError(detail.empty()
              ? fmt::format("command '{}' did not finish within {}ms",
                            command, timeout.count())
              : fmt::format("command '{}' did not finish within {}ms: {}",
                            command, timeout.count(), detail)),
          command_(command), timeout_(timeout) {}

    const std::string& command() const { return command_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};
