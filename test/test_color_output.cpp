#include "test_util.hpp"
#include "util/color_output.hpp"

#include <string>

using namespace humanfmt;

static std::string capture(void (*fn)(const std::string&, std::FILE*),
                           const std::string& msg) {
    std::FILE* f = std::tmpfile();
    fn(msg, f);
    std::rewind(f);
    std::string out;
    int c;
    while ((c = std::fgetc(f)) != EOF) out += static_cast<char>(c);
    std::fclose(f);
    return out;
}

static void test_parse_color() {
    Color c = Color::kDefault;
    CHECK(parse_color("red", c));
    CHECK(c == Color::kRed);
    CHECK(parse_color("Cyan", c));
    CHECK(c == Color::kCyan);
    CHECK(parse_color("DEFAULT", c));
    CHECK(c == Color::kDefault);
    c = Color::kBlue;
    CHECK(!parse_color("orange", c));
    CHECK(c == Color::kBlue);
}

static void test_colorize() {
    set_color_enabled(true);
    CHECK(color_enabled());
    CHECK_STR_EQ(colorize(Color::kGreen, "ok"), "\x1b[32mok\x1b[0m");
    CHECK_STR_EQ(colorize(Color::kBlue, "run", true), "\x1b[1m\x1b[34mrun\x1b[0m");
    CHECK_STR_EQ(colorize(Color::kDefault, "x"), "x\x1b[0m");

    set_color_enabled(false);
    CHECK_STR_EQ(colorize(Color::kRed, "plain", true), "plain");
}

static void test_messages() {
    set_color_enabled(true);
    CHECK_STR_EQ(capture(cerror, "boom"), "\x1b[31merror: boom\x1b[0m\n");
    CHECK_STR_EQ(capture(cfatal_error, "boom"),
                 "\x1b[1m\x1b[31mfatal error: boom\x1b[0m\n");
    CHECK_STR_EQ(capture(cwarning, "hmm"), "\x1b[33mwarning: hmm\x1b[0m\n");

    set_color_enabled(false);
    CHECK_STR_EQ(capture(cerror, "boom"), "error: boom\n");
    CHECK_STR_EQ(capture(cwarning, "hmm"), "warning: hmm\n");
    CHECK_STR_EQ(capture(ccommand, "ls -l"), "ls -l\n");
    CHECK_STR_EQ(capture(cprogress, "50%"), "50%\n");
    CHECK_STR_EQ(capture(crprogress, "50%"), "\r50%");
}

int main() {
    test_parse_color();
    test_colorize();
    test_messages();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
