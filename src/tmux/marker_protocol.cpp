#include "marker_protocol.hpp"
#include "pane_transport.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <terminal/ansi.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <random>
#include <vector>

std::string random_marker_id() {
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    std::string id;
    id.reserve(MARKER_ID_BYTES * 2);
    for (int i = 0; i < MARKER_ID_BYTES; ++i) {
        id += fmt::format("{:02x}", byte(rd));
    }
    return id;
}

MarkerPair make_marker_pair(const std::string& id) {
    return {id,
            fmt::format("{}_START_{}__", MARKER_PREFIX, id),
            fmt::format("{}_END_{}__", MARKER_PREFIX, id)};
}

std::string build_marker_command(const std::string& cmd, const MarkerPair& markers,
                                 bool with_status) {
    // ST''ART / E''ND: the shell joins the pieces, the pane echo keeps them apart.
    std::string begin = fmt::format("echo {}_ST''ART_{}__", MARKER_PREFIX, markers.id);
    std::string done = fmt::format("echo {}_E''ND_{}__", MARKER_PREFIX, markers.id);
    if (with_status) done += " $?";

    std::string body = cmd;
    rtrim(body);
    if (body.empty()) {
        return begin + "; " + done;
    }

    // The group closes on its own line, so a trailing comment, '&' or ';' in
    // cmd (or a heredoc terminator) never reaches the end echo. The shell
    // reads the whole group before running any of it.
    return begin + "; { " + body + "\n}; " + done;
}

// ── Parsing ─────────────────────────────────────────────────

static bool is_start_line(const std::string& line, const MarkerPair& markers) {
    return line == markers.start;
}

// "<end>" or "<end> <status>". Output that did not end in a newline is glued
// in front of the marker; that tail is handed back through `tail`.
static bool is_end_line(const std::string& line, const MarkerPair& markers,
                        std::optional<int>& exit_code, std::string& tail) {
    auto pos = line.rfind(markers.end);
    if (pos == std::string::npos) return false;

    std::string rest = line.substr(pos + markers.end.size());
    if (rest.empty()) {
        exit_code.reset();
    } else {
        if (rest[0] != ' ') return false;
        std::string status = rest.substr(1);
        trim(status);
        if (!is_all_digits(status)) return false;
        exit_code = safe_stoi(status, 0);
    }
    tail = line.substr(0, pos);
    return true;
}

// The shell's echo of the command: the command alone, or the command after a
// prompt ("$ ls -la", "user@host:~$ ls -la").
static bool is_command_echo(const std::string& line, const std::string& cmd) {
    if (cmd.empty() || !StringUtils::ends_with(line, cmd)) return false;
    if (line.size() == cmd.size()) return true;
    char before = line[line.size() - cmd.size() - 1];
    return before == ' ' || before == '\t';
}

MarkerResult parse_marker_output(const std::string& text, const MarkerPair& markers,
                                 const std::string& cmd) {
    MarkerResult result;

    auto lines = StringUtils::split_lines(text);
    for (auto& line : lines) rtrim(line);

    // Earliest end-marker line, then the nearest start-marker line above it.
    size_t end_idx = lines.size();
    std::string tail;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_end_line(lines[i], markers, result.exit_code, tail)) {
            end_idx = i;
            break;
        }
    }
    if (end_idx == lines.size()) {
        result.exit_code.reset();
        return result;
    }

    size_t start_idx = end_idx;
    for (size_t i = end_idx; i-- > 0;) {
        if (is_start_line(lines[i], markers)) {
            start_idx = i;
            break;
        }
    }
    if (start_idx == end_idx) {
        result.exit_code.reset();
        result.start_missing = true;
        return result;
    }

    std::string command = StringUtils::trim(cmd);
    std::vector<std::string> body;
    bool echo_checked = false;
    for (size_t i = start_idx + 1; i < end_idx; ++i) {
        const auto& line = lines[i];
        if (line.find(markers.start) != std::string::npos ||
            line.find(markers.end) != std::string::npos) {
            continue;  // echo of a marker command
        }
        // Only the first non-blank line can be the shell's echo of cmd.
        if (!echo_checked && !line.empty()) {
            echo_checked = true;
            if (is_command_echo(line, command)) continue;
        }
        body.push_back(line);
    }
    rtrim(tail);
    if (!tail.empty()) body.push_back(tail);
    while (!body.empty() && body.back().empty()) body.pop_back();

    result.output = StringUtils::join(body, "\n");
    result.found = true;
    return result;
}

// ── Execution ───────────────────────────────────────────────

CommandResult execute_with_markers(PaneTransport& transport, const std::string& target,
                                   const std::string& cmd, const MarkerOptions& options) {
    using Clock = std::chrono::steady_clock;
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    MarkerPair markers = make_marker_pair(options.id_source ? options.id_source()
                                                            : random_marker_id());
    std::string wrapped = build_marker_command(cmd, markers, options.exit_status);
    bridge_log(fmt::format("exec[{}] target={} cmd={}", markers.id, target, cmd));

    auto submitted = Clock::now();
    auto deadline = submitted + options.timeout;
    transport.send_keys(target, wrapped, true);

    int polls = 0;
    while (true) {
        ++polls;
        std::string text = strip_ansi(transport.capture(target, CaptureScope::History));
        MarkerResult parsed = parse_marker_output(text, markers, cmd);

        auto now = Clock::now();
        auto elapsed = duration_cast<milliseconds>(now - submitted);
        if (parsed.found) {
            bridge_log(fmt::format("exec[{}] matched after {} poll(s), {}ms, exit={}",
                                   markers.id, polls, elapsed.count(),
                                   parsed.exit_code ? std::to_string(*parsed.exit_code) : "?"));
            return CommandResult{std::move(parsed.output), parsed.exit_code, elapsed};
        }
        if (parsed.start_missing) {
            bridge_log(fmt::format("exec[{}] end marker without start marker", markers.id));
            throw CommandTimeoutError(cmd, options.timeout,
                                      "start marker missing from pane history");
        }
        if (now >= deadline) {
            bridge_log(fmt::format("exec[{}] timed out after {} poll(s)", markers.id, polls));
            throw CommandTimeoutError(cmd, options.timeout);
        }

        auto left = duration_cast<milliseconds>(deadline - now);
        auto nap = std::min(options.poll_interval, left);
        platform::sleep_ms(static_cast<int>(std::max<milliseconds::rep>(nap.count(), 1)));
    }
}
