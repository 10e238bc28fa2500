#pragma once

#include <string>

// Remove ANSI/VT escape sequences from captured pane text.
//
// Strips CSI sequences (colours, cursor movement, erase; any number of
// numeric/';' parameters), OSC strings ended by BEL or ST, DCS/SOS/PM/APC
// strings ended by ST, and short ESC-introduced sequences such as "ESC ( B"
// or "ESC =". An unterminated string sequence is dropped to end of input.
// Every other byte is kept as-is, including newlines and UTF-8. 8-bit C1
// controls are not interpreted, since 0x80-0x9F also occur inside UTF-8.
//
// Idempotent: the output contains no ESC bytes.
std::string strip_ansi(const std::string& text);
