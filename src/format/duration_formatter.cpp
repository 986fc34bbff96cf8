#include "format/duration_formatter.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdint>
#include <cstdio>

#include "core/errors.hpp"

namespace humanfmt {

std::string format_duration(double seconds, int fractional_digits,
                            bool single_hour_digit) {
    char buf[96];
    if (std::isnan(seconds) || seconds < 0) {
        std::snprintf(buf, sizeof(buf),
                      "seconds=%f is negative, expected nonnegative value", seconds);
        throw InvalidArgument(buf);
    }
    if (std::isinf(seconds) || seconds >= 9.2e18) {
        throw InvalidArgument("seconds out of range");
    }
    if (fractional_digits < 0) {
        throw InvalidArgument("fractional digits must be nonnegative; got " +
                              std::to_string(fractional_digits));
    }

    auto whole = static_cast<int64_t>(seconds);
    int64_t hh = whole / 3600;
    int64_t mm = (whole / 60) % 60;
    double ss = seconds - static_cast<double>((whole / 60) * 60);

    char hh_s[32];
    std::snprintf(hh_s, sizeof(hh_s), single_hour_digit ? "%01" PRId64 : "%02" PRId64, hh);

    if (fractional_digits == 0) {
        // nearbyint honors the default round-half-to-even mode
        auto ss_rounded = static_cast<int64_t>(std::nearbyint(ss));
        std::snprintf(buf, sizeof(buf), "%s:%02" PRId64 ":%02" PRId64,
                      hh_s, mm, ss_rounded);
        return buf;
    }

    int len = std::snprintf(nullptr, 0, "%s:%02" PRId64 ":%0*.*f",
                            hh_s, mm, fractional_digits + 3, fractional_digits, ss);
    std::string out(static_cast<size_t>(len) + 1, '\0');
    std::snprintf(&out[0], out.size(), "%s:%02" PRId64 ":%0*.*f",
                  hh_s, mm, fractional_digits + 3, fractional_digits, ss);
    out.resize(static_cast<size_t>(len));
    return out;
}

} // namespace humanfmt
