#include "format/size_formatter.hpp"

#include <cmath>
#include <cstdio>

#include "core/config.hpp"

namespace humanfmt {

namespace {

using u128 = unsigned __int128;

const char* const kLabels[NUM_PREFIXES] = {"K", "M", "G", "T", "P", "E", "Z", "Y"};

u128 ceil_div(u128 a, u128 b) {
    return (a + b - 1) / b;
}

std::string u128_to_string(u128 v) {
    if (v == 0) return "0";
    char buf[40];
    int pos = 40;
    while (v > 0) {
        buf[--pos] = static_cast<char>('0' + static_cast<int>(v % 10));
        v /= 10;
    }
    return std::string(buf + pos, buf + 40);
}

// Render q * 10^-digits, e.g. (307, 2) -> "3.07".
std::string fixed_point(u128 q, int digits) {
    u128 scale = 1;
    for (int i = 0; i < digits; i++) scale *= 10;
    std::string s = u128_to_string(q / scale);
    if (digits > 0) {
        std::string frac = u128_to_string(q % scale);
        s += '.';
        s.append(static_cast<size_t>(digits) - frac.size(), '0');
        s += frac;
    }
    return s;
}

std::string label_for(PrefixSystem prefix, int index) {
    std::string label = kLabels[index];
    if (prefix == PrefixSystem::kIECI) label += 'i';
    return label;
}

// Format num/den with the given prefix system. Callers guarantee that
// num and den are small enough (num < 2^101, den < 2^53) for every
// intermediate product to fit in 128 bits.
std::string format_rational(u128 num, u128 den, PrefixSystem prefix,
                            const SizeFormatOptions& opts) {
    const u128 d = prefix_divisor(prefix);
    const std::string sep = opts.insert_space ? " " : "";

    if (num < d * den) {
        return u128_to_string(num / den) + sep + opts.unit;
    }

    u128 scale = den;
    for (int i = 0; i < NUM_PREFIXES; i++) {
        scale *= d;
        if (num >= d * scale) continue;

        std::string full_unit = sep + label_for(prefix, i) + opts.unit;
        if (!opts.coreutils_mode) {
            // at least three significant figures
            u128 q = ceil_div(num * 100, scale);
            if (q < 1000) return fixed_point(q, 2) + full_unit;
            q = ceil_div(num * 10, scale);
            if (q < 1000) return fixed_point(q, 1) + full_unit;
        } else {
            // numfmt: at most one decimal digit
            u128 q = ceil_div(num * 10, scale);
            if (q < 100) return fixed_point(q, 1) + full_unit;
        }
        u128 q = ceil_div(num, scale);
        if (q == d) {
            // rounded up to the divisor: carry into the next prefix
            num = d * scale;
            continue;
        }
        return fixed_point(q, 0) + full_unit;
    }

    // past the largest prefix
    return fixed_point(ceil_div(num * 10, scale), 1) + sep +
           label_for(prefix, NUM_PREFIXES - 1) + opts.unit;
}

} // namespace

PrefixSystem parse_prefix_system(const std::string& name) {
    if (name == "si") return PrefixSystem::kSI;
    if (name == "iec") return PrefixSystem::kIEC;
    if (name == "iec-i") return PrefixSystem::kIECI;
    throw InvalidArgument("expected iec-i, iec, or si; " + name + " received");
}

const char* prefix_system_name(PrefixSystem prefix) {
    switch (prefix) {
    case PrefixSystem::kSI:   return "si";
    case PrefixSystem::kIEC:  return "iec";
    case PrefixSystem::kIECI: return "iec-i";
    }
    throw InvalidArgument("unknown prefix system " +
                          std::to_string(static_cast<int>(prefix)));
}

uint32_t prefix_divisor(PrefixSystem prefix) {
    switch (prefix) {
    case PrefixSystem::kSI:
        return SI_DIVISOR;
    case PrefixSystem::kIEC:
    case PrefixSystem::kIECI:
        return IEC_DIVISOR;
    }
    throw InvalidArgument("unknown prefix system " +
                          std::to_string(static_cast<int>(prefix)));
}

std::string format_size_exact(uint64_t magnitude, PrefixSystem prefix,
                              const SizeFormatOptions& opts) {
    return format_rational(magnitude, 1, prefix, opts);
}

std::string format_size(double magnitude, PrefixSystem prefix,
                        const SizeFormatOptions& opts) {
    if (std::isnan(magnitude) || magnitude < 0) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "size must be nonnegative; got %f", magnitude);
        throw InvalidArgument(buf);
    }
    if (std::isinf(magnitude) || magnitude >= std::ldexp(1.0, 100)) {
        throw InvalidArgument("size out of range");
    }

    const uint32_t d = prefix_divisor(prefix);
    if (magnitude < d) {
        const std::string sep = opts.insert_space ? " " : "";
        return std::to_string(static_cast<uint32_t>(magnitude)) + sep + opts.unit;
    }

    // magnitude = mantissa * 2^exp exactly, mantissa < 2^53
    int exp = 0;
    double frac = std::frexp(magnitude, &exp);
    auto mantissa = static_cast<uint64_t>(std::ldexp(frac, 53));
    exp -= 53;

    u128 num = mantissa;
    u128 den = 1;
    if (exp >= 0) {
        num <<= exp;
    } else {
        den <<= -exp;
    }
    return format_rational(num, den, prefix, opts);
}

} // namespace humanfmt
