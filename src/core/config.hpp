#pragma once

#include <cstddef>
#include <cstdint>

namespace humanfmt {

// Size prefix divisors
inline constexpr uint32_t SI_DIVISOR = 1000;
inline constexpr uint32_t IEC_DIVISOR = 1024;
inline constexpr int NUM_PREFIXES = 8;  // K M G T P E Z Y

// Floor applied to elapsed times used as divisors (seconds)
inline constexpr double MIN_ELAPSED_SEC = 0.001;

// Progress bar geometry
inline constexpr int BAR_RESERVED_COLUMNS = 48;  // numeric fields around the bar
inline constexpr int BAR_MIN_TERMINAL_COLUMNS = 58;
inline constexpr int BAR_FALLBACK_WIDTH = 10;
inline constexpr int ETA_FIELD_WIDTH = 11;       // "ETA H:MM:SS"

// Default refresh intervals (seconds)
inline constexpr double DEFAULT_TEXT_INTERVAL = 0.1;
inline constexpr double DEFAULT_BAR_INTERVAL = 1.0;

// Chunked hashing
inline constexpr size_t DEFAULT_CHUNK_SIZE = 65536;

} // namespace humanfmt
