#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "core/errors.hpp"

namespace humanfmt {

// Unit prefix convention.
//   kSI   : powers of 1000, labels K M G ...
//   kIEC  : powers of 1024, labels K M G ...
//   kIECI : powers of 1024, labels Ki Mi Gi ...
enum class PrefixSystem { kSI, kIEC, kIECI };

struct SizeFormatOptions {
    std::string unit = "B";       // appended after the prefix label
    bool insert_space = false;    // "30.0 MiB" instead of "30.0MiB"
    bool coreutils_mode = false;  // numfmt(1) precision: at most one decimal
};

// Parse "si", "iec" or "iec-i". Throws InvalidArgument otherwise.
PrefixSystem parse_prefix_system(const std::string& name);

const char* prefix_system_name(PrefixSystem prefix);

// 1000 for kSI, 1024 for the IEC systems.
uint32_t prefix_divisor(PrefixSystem prefix);

// Exact formatting of an unsigned magnitude.
//
// Values below the divisor print as a bare integer ("314B"). Larger values
// are scaled to the first prefix that brings them below the divisor and
// rounded *upward*: at least three significant figures by default
// ("3.07KiB", "30.7KiB", "315KiB"), at most one decimal in coreutils mode
// ("3.1K", "31K"). A rounded value equal to the divisor moves on to the
// next prefix ("1.00MB", never "1000KB").
//
// Rounding is done on a 128-bit rational, so the result is exact for the
// whole uint64_t range. Above 1 EiB numfmt(1) itself runs out of long
// double precision and may print a smaller value; this function is the
// correct one there.
std::string format_size_exact(uint64_t magnitude,
                              PrefixSystem prefix = PrefixSystem::kIECI,
                              const SizeFormatOptions& opts = {});

// Integer entry point. Negative magnitudes throw InvalidArgument.
template <typename Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
std::string format_size(Int magnitude,
                        PrefixSystem prefix = PrefixSystem::kIECI,
                        const SizeFormatOptions& opts = {}) {
    if constexpr (std::is_signed_v<Int>) {
        if (magnitude < 0) {
            throw InvalidArgument("size must be nonnegative; got " +
                                  std::to_string(magnitude));
        }
    }
    return format_size_exact(static_cast<uint64_t>(magnitude), prefix, opts);
}

// Real-valued magnitude (transfer rates). The binary value of the double is
// converted exactly, so 1024.0001 bytes still rounds up to "1.01KiB".
// Throws InvalidArgument for negative, NaN, infinite or >= 2^100 values.
// Below the divisor the integer part is printed ("999B" for 999.7).
std::string format_size(double magnitude,
                        PrefixSystem prefix = PrefixSystem::kIECI,
                        const SizeFormatOptions& opts = {});

} // namespace humanfmt
