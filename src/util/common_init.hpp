#pragma once

#include "util/cli_parser.hpp"
#include "util/color_output.hpp"
#include "util/config_file.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <unistd.h>

// HUMANFMT_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace humanfmt {

// Relative location of the shared user configuration.
inline constexpr const char* USER_CONFIG_PATH = "humanfmt/config.json";

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, HUMANFMT_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose flags. With --log, entries are also
// appended to $XDG_DATA_HOME/<cmd_name>/<cmd_name>.log.
inline Logger make_logger(const CliParser& cli, const char* cmd_name) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    Logger logger(verbose ? Logger::kDebug : Logger::kWarn);
    if (cli.has("--log")) {
        std::string err;
        std::string path = log_file_path(cmd_name, LogDestination::kData, err);
        if (path.empty() || !logger.open_file(path, Logger::kInfo, err)) {
            cwarning(err);
        }
    }
    return logger;
}

// Load the shared user configuration. A missing file is not an error;
// an unreadable or malformed one is reported and ignored.
inline ConfigFile load_user_config(const Logger& logger) {
    ConfigFile config;
    std::string path = config_file_path(USER_CONFIG_PATH);
    if (path.empty() || ::access(path.c_str(), F_OK) != 0) {
        logger.debug("no user configuration at %s", path.c_str());
        return config;
    }
    std::string err;
    if (!config.load_file(path, false, err)) {
        cwarning(err);
        return ConfigFile();
    }
    logger.debug("loaded configuration from %s", path.c_str());
    return config;
}

} // namespace humanfmt
