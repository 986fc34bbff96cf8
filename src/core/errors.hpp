#pragma once

#include <stdexcept>
#include <string>

namespace humanfmt {

// Bad input value: negative magnitude or duration, zero total size,
// unknown prefix system or digest name.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

// Operation on a progress reporter that has already been finished.
class IllegalState : public std::logic_error {
public:
    explicit IllegalState(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace humanfmt
