#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/version.hpp"
#include "format/duration_formatter.hpp"
#include "format/size_formatter.hpp"
#include "hash/file_hash.hpp"
#include "progress/progress_bar.hpp"
#include "term/foreground.hpp"
#include "util/cli_parser.hpp"
#include "util/color_output.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

using namespace humanfmt;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [FILE...]\n"
        "\n"
        "Print the message digest of each FILE (stdin if none or '-'),\n"
        "with a progress bar on interactive terminals.\n"
        "\n"
        "Options:\n"
        "  -a, --algorithm <name>   Digest name known to OpenSSL (default: sha1)\n"
        "  -c, --chunk-size <size>  Read size, e.g. 64K or 1M (default: 64K)\n"
        "  -i, --interval <sec>     Progress refresh interval (default: 1.0)\n"
        "  --instant                Show instantaneous instead of cumulative speed\n"
        "  --progress               Always show the progress bar\n"
        "  --no-progress            Never show the progress bar\n"
        "  -v, --verbose            Verbose output\n"
        "  --log                    Also log to $XDG_DATA_HOME/filehash/filehash.log\n"
        "  --version                Print version and exit\n"
        "  -h, --help               Show this help\n"
        "\n"
        "Defaults may be set in $XDG_CONFIG_HOME/humanfmt/config.json\n"
        "(keys: algorithm, chunk_size, refresh_interval, speed_mode).\n",
        prog);
}

struct HashSettings {
    std::string algorithm;
    size_t chunk_size;
    double interval;
    SpeedMode speed_mode;
    bool progress;
};

static bool hash_one(const std::string& path, const HashSettings& settings,
                     const Logger& logger) {
    std::string digest, err;

    if (path == "-") {
        if (!hash_stream(std::cin, digest, err, settings.algorithm, settings.chunk_size)) {
            cerror("stdin: " + err);
            return false;
        }
        std::printf("%s  -\n", digest.c_str());
        return true;
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        cerror("cannot stat " + path + ": " + ec.message());
        return false;
    }

    std::unique_ptr<ProgressBar> bar;
    if (settings.progress && size > 0) {
        bar = std::make_unique<ProgressBar>(size, 0, settings.interval, settings.speed_mode);
    }

    ChunkCallback on_chunk;
    if (bar) on_chunk = [&bar](uint64_t n) { bar->update(n); };

    bool ok = hash_file(path, digest, err, settings.algorithm, settings.chunk_size, on_chunk);
    if (!ok) {
        if (bar) std::fputc('\n', stderr);
        cerror(err);
        return false;
    }

    if (bar) {
        bar->finish();
        double elapsed = bar->elapsed();
        logger.info("%s: %s in %s (%s/s)", path.c_str(),
                    format_size(size).c_str(),
                    format_duration(elapsed, 2).c_str(),
                    format_size(static_cast<double>(size) / elapsed).c_str());
    } else {
        logger.info("%s: %s", path.c_str(), format_size(size).c_str());
    }

    std::printf("%s  %s\n", digest.c_str(), path.c_str());
    std::fflush(stdout);
    return true;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, {"--instant", "--progress", "--no-progress", "-v",
                               "--verbose", "--log", "--version", "-h", "--help"});

    if (check_version(cli, "filehash")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "filehash");
    ConfigFile config = load_user_config(logger);

    HashSettings settings;
    settings.algorithm = cli.get_string("--algorithm", cli.get_string("-a",
                             config.get_string("algorithm", "sha1")));

    std::string chunk_s = cli.get_string("--chunk-size", cli.get_string("-c",
                              config.get_string("chunk_size", "")));
    settings.chunk_size = DEFAULT_CHUNK_SIZE;
    if (!chunk_s.empty()) {
        uint64_t parsed = 0;
        if (!parse_size_string(chunk_s, parsed)) {
            cerror("invalid chunk size '" + chunk_s + "'");
            return 1;
        }
        settings.chunk_size = static_cast<size_t>(parsed);
    } else if (config.get_int("chunk_size", 0) > 0) {
        settings.chunk_size = static_cast<size_t>(config.get_int("chunk_size", 0));
    }

    settings.interval = cli.get_double("--interval", cli.get_double("-i",
                            config.get_double("refresh_interval", DEFAULT_BAR_INTERVAL)));
    if (!(settings.interval >= 0)) {
        cerror("refresh interval must be nonnegative");
        return 1;
    }

    try {
        settings.speed_mode = cli.has("--instant")
                                  ? SpeedMode::kInstant
                                  : parse_speed_mode(config.get_string("speed_mode", "cumulative"));
        hash_string("", settings.algorithm);  // validate the digest name up front
    } catch (const InvalidArgument& e) {
        cerror(e.what());
        return 1;
    }

    if (cli.has("--no-progress")) {
        settings.progress = false;
    } else if (cli.has("--progress")) {
        settings.progress = true;
    } else {
        settings.progress = is_interactive();
    }

    logger.debug("algorithm=%s chunk_size=%zu interval=%.3f speed_mode=%s progress=%d",
                 settings.algorithm.c_str(), settings.chunk_size, settings.interval,
                 speed_mode_name(settings.speed_mode), settings.progress ? 1 : 0);

    std::vector<std::string> paths = cli.positional();
    if (paths.empty()) paths.push_back("-");

    int rc = 0;
    try {
        for (const auto& path : paths) {
            if (!hash_one(path, settings, logger)) rc = 1;
        }
    } catch (const std::system_error& e) {
        cfatal_error(e.what());
        return 1;
    }
    return rc;
}
