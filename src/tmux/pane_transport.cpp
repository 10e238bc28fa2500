#include "pane_transport.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

TmuxTransport::TmuxTransport(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) throw std::invalid_argument("TmuxTransport requires a command runner");
}

ProcessResult TmuxTransport::invoke(const std::vector<std::string>& args) {
    auto result = runner_->run(args);
    if (result.is_err()) {
        throw TransportError(fmt::format("could not run tmux {}: {}",
                                         args.empty() ? "" : args.front(), result.error));
    }
    return std::move(result.value);
}

// ── Session probing ─────────────────────────────────────────

bool TmuxTransport::session_exists(const std::string& target) {
    auto r = invoke({"has-session", "-t", target});
    if (r.success()) return true;

    // "error connecting to <socket> (<reason>)": the server socket exists but
    // could not be reached. A missing socket file just means no server.
    const auto& err = r.stderr_data;
    if (err.find("error connecting to") != std::string::npos &&
        err.find("No such file or directory") == std::string::npos) {
        std::string reason = err;
        trim(reason);
        throw TransportError(fmt::format("tmux server unreachable: {}", reason));
    }
    return false;
}

std::vector<std::string> TmuxTransport::list_sessions() {
    auto r = invoke({"list-sessions", "-F", "#{session_name}"});
    if (r.failed()) return {};

    std::vector<std::string> names;
    for (auto& line : StringUtils::split_lines(r.stdout_data)) {
        if (!StringUtils::trim(line).empty()) names.push_back(line);
    }
    return names;
}

// ── Keys ────────────────────────────────────────────────────

std::string TmuxTransport::escape_trailing_semicolon(const std::string& text) {
    if (text.empty() || text.back() != ';') return text;
    return text.substr(0, text.size() - 1) + "\\;";
}

void TmuxTransport::send_keys(const std::string& target, const std::string& text,
                              bool submit) {
    if (!text.empty()) {
        auto r = invoke({"send-keys", "-t", target, "-l", "--",
                         escape_trailing_semicolon(text)});
        if (r.failed()) {
            throw TransportError(fmt::format("send-keys to '{}' failed: {}",
                                             target, StringUtils::trim(r.stderr_data)));
        }
    }
    if (submit) {
        auto r = invoke({"send-keys", "-t", target, "Enter"});
        if (r.failed()) {
            throw TransportError(fmt::format("send-keys Enter to '{}' failed: {}",
                                             target, StringUtils::trim(r.stderr_data)));
        }
    }
}

// ── Capture ─────────────────────────────────────────────────

std::string TmuxTransport::capture(const std::string& target, CaptureScope scope) {
    // -J joins wrapped lines so a marker split by the pane width stays whole.
    std::vector<std::string> args = {"capture-pane", "-p", "-J", "-t", target};
    if (scope == CaptureScope::History) {
        args.push_back("-S");
        args.push_back("-");
    }

    auto r = invoke(args);
    if (r.failed()) {
        throw TransportError(fmt::format("capture-pane of '{}' failed: {}",
                                         target, StringUtils::trim(r.stderr_data)));
    }
    return std::move(r.stdout_data);
}
