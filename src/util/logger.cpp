#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace humanfmt {

std::string log_file_path(const std::string& name, LogDestination dest,
                          std::string& error_msg) {
    const char* env_var = dest == LogDestination::kData ? "XDG_DATA_HOME" : "XDG_CACHE_HOME";
    const char* fallback = dest == LogDestination::kData ? ".local/share" : ".cache";

    std::filesystem::path root;
    const char* env = std::getenv(env_var);
    if (env && *env) {
        root = env;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || !*home) {
            error_msg = std::string("neither ") + env_var + " nor HOME is set";
            return {};
        }
        root = std::filesystem::path(home) / fallback;
    }

    std::filesystem::path dir = root / name;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error_msg = "cannot create " + dir.string() + ": " + ec.message();
        return {};
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        error_msg = "cannot set permissions on " + dir.string() + ": " + ec.message();
        return {};
    }
    return (dir / (name + ".log")).string();
}

bool Logger::open_file(const std::string& path, Level file_level,
                       std::string& error_msg) {
    std::FILE* fp = std::fopen(path.c_str(), "a");
    if (!fp) {
        error_msg = "cannot open log file " + path + ": " + std::strerror(errno);
        return false;
    }
    file_.reset(fp, [](std::FILE* f) { std::fclose(f); });
    file_level_ = file_level;
    return true;
}

void Logger::error(const char* fmt, ...) const {
    va_list ap;
    va_start(ap, fmt);
    log_impl(kError, "ERROR", fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) const {
    va_list ap;
    va_start(ap, fmt);
    log_impl(kWarn, "WARN", fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) const {
    va_list ap;
    va_start(ap, fmt);
    log_impl(kInfo, "INFO", fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) const {
    va_list ap;
    va_start(ap, fmt);
    log_impl(kDebug, "DEBUG", fmt, ap);
    va_end(ap);
}

void Logger::log_impl(Level level, const char* tag, const char* fmt,
                      va_list ap) const {
    if (file_ && level <= file_level_) {
        char stamp[40];
        std::time_t now = std::time(nullptr);
        std::tm tm_buf;
        localtime_r(&now, &tm_buf);
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S%z", &tm_buf);

        va_list file_ap;
        va_copy(file_ap, ap);
        std::fprintf(file_.get(), "%s %s ", stamp, tag);
        std::vfprintf(file_.get(), fmt, file_ap);
        std::fprintf(file_.get(), "\n");
        std::fflush(file_.get());
        va_end(file_ap);
    }

    if (level > level_) return;
    std::fprintf(stderr, "[%s] ", tag);
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}

} // namespace humanfmt
