#pragma once

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <string>

namespace humanfmt {

// Where log files live: $XDG_DATA_HOME (~/.local/share) or
// $XDG_CACHE_HOME (~/.cache).
enum class LogDestination { kData, kCache };

// Resolve <root>/<name>/<name>.log and create <root>/<name> with mode 0700.
// Returns an empty string and sets error_msg if the directory cannot be made.
std::string log_file_path(const std::string& name, LogDestination dest,
                          std::string& error_msg);

// Simple logger writing "[TAG] message" lines to stderr, optionally also
// appending timestamped entries to a log file.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // Append entries at file_level and above to path.
    // Entries look like "2016-01-02T03:04:05+0000 INFO message".
    bool open_file(const std::string& path, Level file_level,
                   std::string& error_msg);
    bool has_file() const { return file_ != nullptr; }

    void error(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
    void warn(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
    void info(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
    void debug(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));

private:
    Level level_;
    Level file_level_ = kInfo;
    std::shared_ptr<std::FILE> file_;

    void log_impl(Level level, const char* tag, const char* fmt, va_list ap) const;
};

} // namespace humanfmt
