#pragma once

#include <optional>

namespace humanfmt {

// Column count of the controlling terminal, asked of stderr first and then
// stdout. std::nullopt if neither is a terminal or the size is unknown.
std::optional<int> terminal_columns();

// Column count of the terminal behind fd, if any.
std::optional<int> terminal_columns(int fd);

} // namespace humanfmt
