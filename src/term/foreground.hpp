#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace humanfmt {

// Decide whether a live progress display is wanted: stderr is a terminal
// and this process is in that terminal's foreground process group.
//
// When the process state cannot be read, a warning is printed and the
// answer rests on the terminal check alone.
bool is_interactive();

// Same decision from an already known terminal check, reading the process
// state from stat_path and printing the warning to warn_out.
bool is_interactive(bool on_terminal, const std::string& stat_path,
                    std::FILE* warn_out);

// Foreground state from a stat file in /proc/<pid>/stat format.
// std::nullopt if the file cannot be read or parsed.
std::optional<bool> query_foreground(const std::string& stat_path = "/proc/self/stat");

// Parse one /proc/<pid>/stat line. A process is in the foreground when its
// process group (field 5) equals the terminal's foreground group (field 8),
// which is what ps(1) marks with '+' in the state column.
std::optional<bool> parse_foreground_state(const std::string& stat_line);

} // namespace humanfmt
