#include "test_util.hpp"
#include "core/errors.hpp"
#include "format/duration_formatter.hpp"

#include <cmath>

using namespace humanfmt;

static void test_whole_seconds() {
    CHECK_STR_EQ(format_duration(0), "00:00:00");
    CHECK_STR_EQ(format_duration(3661), "01:01:01");
    CHECK_STR_EQ(format_duration(10.55), "00:00:11");
    CHECK_STR_EQ(format_duration(359999), "99:59:59");
    CHECK_STR_EQ(format_duration(360000), "100:00:00");
}

static void test_ties_round_to_even() {
    CHECK_STR_EQ(format_duration(0.5), "00:00:00");
    CHECK_STR_EQ(format_duration(10.5), "00:00:10");
    CHECK_STR_EQ(format_duration(11.5), "00:00:12");
    // the seconds field is rounded on its own and may read 60
    CHECK_STR_EQ(format_duration(59.6), "00:00:60");
}

static void test_fractional_digits() {
    CHECK_STR_EQ(format_duration(10.55, 1), "00:00:10.6");
    CHECK_STR_EQ(format_duration(10.55, 2), "00:00:10.55");
    CHECK_STR_EQ(format_duration(3723.25, 3), "01:02:03.250");
    CHECK_STR_EQ(format_duration(7.0, 1), "00:00:07.0");
    CHECK_STR_EQ(format_duration(0.125, 6), "00:00:00.125000");
}

static void test_single_hour_digit() {
    CHECK_STR_EQ(format_duration(10.55, 0, true), "0:00:11");
    CHECK_STR_EQ(format_duration(35999, 0, true), "9:59:59");
    // two digits from ten hours on, flag or not
    CHECK_STR_EQ(format_duration(36000, 0, true), "10:00:00");
    CHECK_STR_EQ(format_duration(86400, 0, true), "24:00:00");
}

static void test_invalid() {
    CHECK_THROWS(format_duration(-1), InvalidArgument);
    CHECK_THROWS(format_duration(-0.001, 2), InvalidArgument);
    CHECK_THROWS(format_duration(std::nan("")), InvalidArgument);
    CHECK_THROWS(format_duration(HUGE_VAL), InvalidArgument);
    CHECK_THROWS(format_duration(1, -1), InvalidArgument);
}

int main() {
    test_whole_seconds();
    test_ties_round_to_even();
    test_fractional_digits();
    test_single_hour_digit();
    test_invalid();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
