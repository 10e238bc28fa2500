#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Debug log: <tmp>/tmuxbridge_debug.log unless set_bridge_log_path() moved it.
std::string bridge_log_path();
void set_bridge_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line. Failure to open the log is ignored.
void bridge_log(const std::string& msg);

// Log one tmux invocation: argv, exit code and the head of its output.
void bridge_log_process(const std::string& label,
                        const std::vector<std::string>& argv,
                        const ProcessResult& r);
