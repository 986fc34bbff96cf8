#include "core/errors.hpp"
#include "core/version.hpp"
#include "format/size_formatter.hpp"
#include "util/cli_parser.hpp"
#include "util/color_output.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace humanfmt;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [SIZE...]\n"
        "\n"
        "Convert size in number of bytes to human readable format.\n"
        "Sizes are read one per line from stdin when none are given.\n"
        "\n"
        "Options:\n"
        "  -p, --prefix <system>    iec-i, iec, or si (default: iec-i)\n"
        "  -u, --unit <unit>        Unit to attach to the prefix (default: B);\n"
        "                           pass an empty string to suppress the unit\n"
        "  -s, --space              Insert a space between number and prefix\n"
        "  -n, --numfmt             Use the number format of coreutils numfmt(1)\n"
        "  -v, --verbose            Verbose output\n"
        "  --log                    Also log to $XDG_DATA_HOME/humansize/humansize.log\n"
        "  --version                Print version and exit\n"
        "  -h, --help               Show this help\n"
        "\n"
        "Defaults may be set in $XDG_CONFIG_HOME/humanfmt/config.json\n"
        "(keys: prefix, unit, space, numfmt).\n",
        prog);
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Returns false and sets error_msg if value is not an integer size.
static bool convert(const std::string& raw, PrefixSystem prefix,
                    const SizeFormatOptions& opts, std::string& out,
                    std::string& error_msg) {
    std::string value = trim(raw);
    if (value.empty()) {
        error_msg = "empty size";
        return false;
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    try {
        if (value[0] == '-') {
            long long v = std::strtoll(begin, &end, 10);
            if (*end != '\0' || errno == ERANGE) {
                error_msg = "invalid size '" + value + "'";
                return false;
            }
            out = format_size(v, prefix, opts);
        } else {
            unsigned long long v = std::strtoull(begin, &end, 10);
            if (*end != '\0' || errno == ERANGE) {
                error_msg = "invalid size '" + value + "'";
                return false;
            }
            out = format_size(static_cast<uint64_t>(v), prefix, opts);
        }
    } catch (const InvalidArgument& e) {
        error_msg = e.what();
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    // negative sizes stay positional so they are reported, not dropped
    CliParser cli(argc, argv, {"-s", "--space", "-n", "--numfmt", "-v", "--verbose",
                               "--log", "--version", "-h", "--help"},
                  true);

    if (check_version(cli, "humansize")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "humansize");
    ConfigFile config = load_user_config(logger);

    PrefixSystem prefix;
    try {
        std::string name = cli.get_string("--prefix", cli.get_string("-p",
                               config.get_string("prefix", "iec-i")));
        prefix = parse_prefix_system(name);
    } catch (const InvalidArgument& e) {
        cerror(e.what());
        return 1;
    }

    SizeFormatOptions opts;
    opts.unit = config.get_string("unit", "B");
    if (cli.has("-u")) opts.unit = cli.get_string("-u");
    if (cli.has("--unit")) opts.unit = cli.get_string("--unit");
    opts.insert_space = cli.has_any({"-s", "--space"}) || config.get_bool("space", false);
    opts.coreutils_mode = cli.has_any({"-n", "--numfmt"}) || config.get_bool("numfmt", false);

    logger.debug("prefix=%s unit='%s' space=%d numfmt=%d",
                 prefix_system_name(prefix), opts.unit.c_str(),
                 opts.insert_space ? 1 : 0, opts.coreutils_mode ? 1 : 0);

    std::vector<std::string> inputs = cli.positional();
    if (inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (trim(line).empty()) continue;
            inputs.push_back(line);
        }
    }

    int rc = 0;
    for (const auto& input : inputs) {
        std::string formatted, err;
        if (!convert(input, prefix, opts, formatted, err)) {
            cerror(err);
            logger.info("rejected input '%s': %s", input.c_str(), err.c_str());
            rc = 1;
            continue;
        }
        std::printf("%s\n", formatted.c_str());
    }
    std::fflush(stdout);
    return rc;
}
