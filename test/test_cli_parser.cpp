#include "test_util.hpp"
#include "util/cli_parser.hpp"
#include "util/size_parser.hpp"

#include <vector>

using namespace humanfmt;

namespace {

// argv storage for the parser.
struct Args {
    std::vector<std::string> words;
    std::vector<char*> ptrs;

    Args(std::initializer_list<const char*> list) : words(list.begin(), list.end()) {
        for (auto& w : words) ptrs.push_back(&w[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(words.size()); }
    char** argv() { return ptrs.data(); }
};

} // namespace

static void test_options_and_positionals() {
    Args a{"humansize", "-p", "si", "--unit", "bps", "100", "2048"};
    CliParser cli(a.argc(), a.argv());
    CHECK_STR_EQ(cli.program(), "humansize");
    CHECK(cli.has("-p"));
    CHECK_STR_EQ(cli.get_string("-p"), "si");
    CHECK_STR_EQ(cli.get_string("--unit"), "bps");
    CHECK_EQ(cli.positional().size(), 2u);
    CHECK_STR_EQ(cli.positional()[0], "100");
    CHECK_STR_EQ(cli.positional()[1], "2048");
    CHECK(!cli.has("-u"));
    CHECK_STR_EQ(cli.get_string("-u", "B"), "B");
}

static void test_flags_do_not_consume() {
    Args a{"humansize", "-s", "512", "-n"};
    CliParser with_flags(a.argc(), a.argv(), {"-s", "-n"});
    CHECK(with_flags.has("-s"));
    CHECK_STR_EQ(with_flags.get_string("-s", "x"), "");
    CHECK(with_flags.has("-n"));
    CHECK_EQ(with_flags.positional().size(), 1u);

    CliParser without(a.argc(), a.argv());
    CHECK_STR_EQ(without.get_string("-s"), "512");
    CHECK_EQ(without.positional().size(), 0u);
}

static void test_equals_and_double_dash() {
    Args a{"filehash", "--algorithm=sha256", "-v", "--", "-odd-name", "b"};
    CliParser cli(a.argc(), a.argv(), {"-v"});
    CHECK_STR_EQ(cli.get_string("--algorithm"), "sha256");
    CHECK(cli.has_any({"-v", "--verbose"}));
    CHECK(!cli.has_any({"-h", "--help"}));
    CHECK_EQ(cli.positional().size(), 2u);
    CHECK_STR_EQ(cli.positional()[0], "-odd-name");
}

static void test_repeated_and_numbers() {
    Args a{"t", "-x", "1", "-x", "2", "-n", "17", "-d", "0.25", "-bad", "abc"};
    CliParser cli(a.argc(), a.argv());
    CHECK_STR_EQ(cli.get_string("-x"), "2");
    CHECK_EQ(cli.get_strings("-x").size(), 2u);
    CHECK_EQ(cli.get_strings("-y").size(), 0u);
    CHECK_EQ(cli.get_int("-n"), 17);
    CHECK_NEAR(cli.get_double("-d"), 0.25, 1e-12);
    CHECK_EQ(cli.get_int("-bad", -3), -3);
    CHECK_EQ(cli.get_int("-missing", 9), 9);
}

static void test_whole_value_required() {
    Args a{"humantime", "-d", "10.55", "-c", "3x", "-i", "0.5s", "-k", "99999999999",
           "-m", " 4"};
    CliParser cli(a.argc(), a.argv());
    CHECK_EQ(cli.get_int("-d", -1), -1);
    CHECK_EQ(cli.get_int("-c", -1), -1);
    CHECK_NEAR(cli.get_double("-i", 1.0), 1.0, 1e-12);
    CHECK_EQ(cli.get_int("-k", -1), -1);
    CHECK_EQ(cli.get_int("-m", -1), 4);
    CHECK_NEAR(cli.get_double("-d", 0.0), 10.55, 1e-12);
}

static void test_negative_numbers() {
    Args a{"humansize", "100", "-5", "-s", "-.5", "-p", "si", "-x"};
    CliParser cli(a.argc(), a.argv(), {"-s"}, true);
    CHECK_EQ(cli.positional().size(), 3u);
    if (cli.positional().size() == 3) {
        CHECK_STR_EQ(cli.positional()[0], "100");
        CHECK_STR_EQ(cli.positional()[1], "-5");
        CHECK_STR_EQ(cli.positional()[2], "-.5");
    }
    CHECK(cli.has("-s"));
    CHECK_STR_EQ(cli.get_string("-p"), "si");
    CHECK(cli.has("-x"));
    CHECK(!cli.has("-5"));

    // a lone negative number is still an input
    Args lone{"humansize", "-5"};
    CliParser single(lone.argc(), lone.argv(), {}, true);
    CHECK_EQ(single.positional().size(), 1u);

    // declared flags win over the number rule
    Args flags{"humantime", "-1", "-5", "3661"};
    CliParser hours(flags.argc(), flags.argv(), {"-1"}, true);
    CHECK(hours.has("-1"));
    CHECK_EQ(hours.positional().size(), 2u);

    // without the switch "-5" is an option
    CliParser plain(a.argc(), a.argv(), {"-s"});
    CHECK(plain.has("-5"));
    CHECK_EQ(plain.positional().size(), 1u);
}

static void test_parse_size_string() {
    uint64_t v = 0;
    CHECK(parse_size_string("4096", v));
    CHECK_EQ(v, 4096u);
    CHECK(parse_size_string("64K", v));
    CHECK_EQ(v, 65536u);
    CHECK(parse_size_string("64KiB", v));
    CHECK_EQ(v, 65536u);
    CHECK(parse_size_string("1m", v));
    CHECK_EQ(v, 1048576u);
    CHECK(parse_size_string("2G", v));
    CHECK_EQ(v, 2147483648u);
    CHECK(parse_size_string("512B", v));
    CHECK_EQ(v, 512u);
    CHECK(parse_size_string("0.5K", v));
    CHECK_EQ(v, 512u);

    CHECK(!parse_size_string("", v));
    CHECK(!parse_size_string("0", v));
    CHECK(!parse_size_string("-4K", v));
    CHECK(!parse_size_string("12Q", v));
    CHECK(!parse_size_string("12KX", v));
    CHECK(!parse_size_string("0.1", v));
    CHECK(!parse_size_string("abc", v));
}

int main() {
    test_options_and_positionals();
    test_flags_do_not_consume();
    test_equals_and_double_dash();
    test_repeated_and_numbers();
    test_negative_numbers();
    test_whole_value_required();
    test_parse_size_string();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
