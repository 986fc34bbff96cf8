#include "term/foreground.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

#include "util/color_output.hpp"

namespace humanfmt {

std::optional<bool> parse_foreground_state(const std::string& stat_line) {
    // comm (field 2) may contain spaces and parentheses; skip to the last ')'
    auto close = stat_line.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream iss(stat_line.substr(close + 1));
    std::string state;
    long ppid = 0, pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    if (!(iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid)) {
        return std::nullopt;
    }
    if (tpgid <= 0) return false;  // no controlling terminal
    return pgrp == tpgid;
}

std::optional<bool> query_foreground(const std::string& stat_path) {
    std::ifstream in(stat_path);
    if (!in) return std::nullopt;
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    return parse_foreground_state(line);
}

bool is_interactive(bool on_terminal, const std::string& stat_path,
                    std::FILE* warn_out) {
    if (!on_terminal) return false;

    auto foreground = query_foreground(stat_path);
    if (!foreground) {
        cwarning("cannot read process state from " + stat_path +
                 "; assuming foreground", warn_out);
        return true;
    }
    return *foreground;
}

bool is_interactive() {
    return is_interactive(::isatty(STDERR_FILENO) != 0, "/proc/self/stat", stderr);
}

} // namespace humanfmt
