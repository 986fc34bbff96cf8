#include "core/errors.hpp"
#include "core/version.hpp"
#include "format/duration_formatter.hpp"
#include "util/cli_parser.hpp"
#include "util/color_output.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace humanfmt;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [SECONDS...]\n"
        "\n"
        "Convert duration in seconds to human readable format (HH:MM:SS).\n"
        "Durations are read one per line from stdin when none are given.\n"
        "\n"
        "Options:\n"
        "  -d, --decimal-digits [N] Print N digits after the decimal point\n"
        "                           (2 if N is omitted; default: round to\n"
        "                           whole seconds)\n"
        "  -1, --one-hour-digit     Only print one hour digit below ten hours\n"
        "  -v, --verbose            Verbose output\n"
        "  --log                    Also log to $XDG_DATA_HOME/humantime/humantime.log\n"
        "  --version                Print version and exit\n"
        "  -h, --help               Show this help\n",
        prog);
}

static bool parse_seconds(const std::string& s, double& out) {
    const char* begin = s.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ' || *end == '\t' || *end == '\r' || *end == '\n') end++;
    return *end == '\0';
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, {"-1", "--one-hour-digit", "-v", "--verbose",
                               "--log", "--version", "-h", "--help"},
                  true);

    if (check_version(cli, "humantime")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "humantime");

    int digits = 0;
    for (const char* key : {"-d", "--decimal-digits"}) {
        if (!cli.has(key)) continue;
        std::string value = cli.get_string(key);
        if (value.empty()) {
            digits = 2;
        } else {
            digits = cli.get_int(key, -1);
            if (digits < 0) {
                cerror("invalid number of decimal digits '" + value + "'");
                return 1;
            }
        }
    }
    bool one_hour_digit = cli.has_any({"-1", "--one-hour-digit"});
    logger.debug("digits=%d one_hour_digit=%d", digits, one_hour_digit ? 1 : 0);

    std::vector<std::string> inputs = cli.positional();
    if (inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
            inputs.push_back(line);
        }
    }

    int rc = 0;
    for (const auto& input : inputs) {
        double seconds = 0;
        if (!parse_seconds(input, seconds)) {
            cerror("invalid duration '" + input + "'");
            rc = 1;
            continue;
        }
        try {
            std::printf("%s\n", format_duration(seconds, digits, one_hour_digit).c_str());
        } catch (const InvalidArgument& e) {
            cerror(e.what());
            rc = 1;
        }
    }
    std::fflush(stdout);
    return rc;
}
