#pragma once

#include <string>

namespace humanfmt {

// Format a nonnegative duration as HH:MM:SS[.frac].
//
// fractional_digits == 0 rounds to the nearest whole second (ties to even)
// and omits the decimal point; otherwise exactly that many digits follow it.
// single_hour_digit drops the leading zero of the hour field below ten
// hours ("0:00:11"); ten hours and up always take two digits.
//
// Throws InvalidArgument for negative or non-finite seconds and for a
// negative digit count.
std::string format_duration(double seconds, int fractional_digits = 0,
                            bool single_hour_digit = false);

} // namespace humanfmt
