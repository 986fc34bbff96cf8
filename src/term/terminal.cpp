#include "term/terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

namespace humanfmt {

std::optional<int> terminal_columns(int fd) {
    struct winsize ws {};
    if (::ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) {
        return std::nullopt;
    }
    return static_cast<int>(ws.ws_col);
}

std::optional<int> terminal_columns() {
    if (auto cols = terminal_columns(STDERR_FILENO)) return cols;
    return terminal_columns(STDOUT_FILENO);
}

} // namespace humanfmt
