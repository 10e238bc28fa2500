#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <core/types.hpp>

class PaneTransport;

// Start/end sentinels for one command execution. Never reused.
struct MarkerPair {
    std::string id;
    std::string start;   // __TMUX_BRIDGE_START_<id>__
    std::string end;     // __TMUX_BRIDGE_END_<id>__
};

struct MarkerResult {
    std::string output;
    std::optional<int> exit_code;
    bool found = false;
    bool start_missing = false;   // end marker seen without a start marker before it
};

struct MarkerOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds poll_interval{250};
    bool exit_status = true;                    // echo $? after the end marker
    std::function<std::string()> id_source;     // empty: random_marker_id()
};

// 32 lowercase hex digits from std::random_device.
std::string random_marker_id();

MarkerPair make_marker_pair(const std::string& id);

// Wrap cmd so the shell prints the start marker, runs cmd inside a { } group,
// then prints the end marker (followed by $? when with_status). The marker
// tokens are split by an empty '' pair, so the keystroke echo never contains
// the literal token while the echo output does. Needs a POSIX-style shell.
std::string build_marker_command(const std::string& cmd, const MarkerPair& markers,
                                 bool with_status);

// Scan normalized pane text for the marker lines and extract what lies
// between them. The start marker only counts as a whole line. The end marker
// ends its line (optionally followed by " <status>"); text before it on that
// line is the unterminated tail of the output. Lines holding marker text and
// the shell's echo of cmd are removed, as are trailing blank lines.
MarkerResult parse_marker_output(const std::string& text, const MarkerPair& markers,
                                 const std::string& cmd);

// Send cmd wrapped in fresh markers and poll the pane's full history until
// both markers are seen. Throws CommandTimeoutError when options.timeout
// (measured from submission) passes first or the start marker is missing;
// TransportError propagates from the transport. The command is never
// interrupted.
//
// Only one execution may be outstanding per target; callers serialize.
CommandResult execute_with_markers(PaneTransport& transport, const std::string& target,
                                   const std::string& cmd, const MarkerOptions& options);
