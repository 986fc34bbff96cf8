#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace humanfmt {

// Text for a progress line: either a literal string or a producer that is
// only called when the line is actually redrawn.
class ProgressContent {
public:
    ProgressContent(std::string text) : value_(std::move(text)) {}
    ProgressContent(const char* text) : value_(std::string(text)) {}

    template <typename F,
              std::enable_if_t<std::is_invocable_r_v<std::string, F&> &&
                               !std::is_convertible_v<F, std::string>, int> = 0>
    ProgressContent(F producer)
        : value_(std::function<std::string()>(std::move(producer))) {}

    bool is_producer() const {
        return std::holds_alternative<std::function<std::string()>>(value_);
    }

    std::string resolve() const {
        if (const auto* text = std::get_if<std::string>(&value_)) return *text;
        return std::get<std::function<std::string()>>(value_)();
    }

private:
    std::variant<std::string, std::function<std::string()>> value_;
};

} // namespace humanfmt
