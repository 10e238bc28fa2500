#include "tmux_controller.hpp"
#include "marker_protocol.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <terminal/ansi.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

TmuxController::TmuxController(std::string target,
                               std::shared_ptr<PaneTransport> transport,
                               ControllerOptions options)
    : target_(std::move(target)), transport_(std::move(transport)),
      options_(std::move(options)) {
    if (!transport_) throw std::invalid_argument("TmuxController requires a transport");

    if (!transport_->session_exists(target_)) {
        bridge_log(fmt::format("controller: target '{}' not found", target_));
        throw SessionNotFoundError(target_);
    }
    bridge_log(fmt::format("controller: attached to '{}'", target_));
}

CommandResult TmuxController::execute(const std::string& command,
                                      std::optional<std::chrono::milliseconds> timeout) {
    MarkerOptions opts;
    opts.timeout = timeout.value_or(options_.timeout);
    opts.poll_interval = options_.poll_interval;
    opts.exit_status = options_.exit_status;
    opts.id_source = options_.marker_id_source;
    return execute_with_markers(*transport_, target_, command, opts);
}

std::string TmuxController::execute_and_wait(const std::string& command,
                                             std::optional<std::chrono::milliseconds> timeout) {
    return execute(command, timeout).output;
}

void TmuxController::send_keys(const std::string& text, bool enter) {
    transport_->send_keys(target_, text, enter);
}

std::string TmuxController::read_buffer(std::optional<size_t> lines) {
    std::string text = strip_ansi(transport_->capture(target_, CaptureScope::Visible));
    if (!lines) return text;
    return StringUtils::tail_lines(text, *lines);
}

std::vector<std::string> TmuxController::list_sessions(PaneTransport& transport) {
    return transport.list_sessions();
}
