#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace humanfmt {

// Parse a size string with optional binary suffix (K, M, G, T), optionally
// followed by "i" and/or "B": "64K", "64KiB", "1M", "4096".
// Returns false on a malformed, negative or zero size.
inline bool parse_size_string(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || !(val > 0)) return false;

    uint64_t multiplier = 1;
    if (*end != '\0') {
        switch (std::toupper(static_cast<unsigned char>(*end))) {
            case 'K': multiplier = uint64_t(1) << 10; break;
            case 'M': multiplier = uint64_t(1) << 20; break;
            case 'G': multiplier = uint64_t(1) << 30; break;
            case 'T': multiplier = uint64_t(1) << 40; break;
            case 'B': multiplier = 1; --end; break;
            default: return false; // unknown suffix
        }
        ++end;
        if (*end == 'i') ++end;
        if (*end == 'B') ++end;
        if (*end != '\0') return false;
    }
    double bytes = val * static_cast<double>(multiplier);
    if (bytes < 1 || bytes >= 18446744073709551616.0) return false;
    out = static_cast<uint64_t>(bytes);
    return true;
}

} // namespace humanfmt
