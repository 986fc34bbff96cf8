#include "progress/progress_reporter.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <system_error>

#include "core/errors.hpp"
#include "format/duration_formatter.hpp"

namespace humanfmt {

double monotonic_seconds() {
    return std::chrono::duration<double>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

static double check_interval(double interval) {
    if (std::isnan(interval) || interval < 0) {
        throw InvalidArgument("refresh interval must be nonnegative");
    }
    return interval;
}

ProgressReporter::ProgressReporter(double refresh_interval, bool show_elapsed,
                                   const ProgressContent& initial_text,
                                   ProgressSink sink)
    : sink_(std::move(sink)),
      start_(sink_.clock()),
      session_(Session{check_interval(refresh_interval), show_elapsed, start_}) {
    update(initial_text, true);
}

void ProgressReporter::require_active() const {
    if (!session_) throw IllegalState("operation on finished instance");
}

void ProgressReporter::update(const ProgressContent& content, bool force) {
    require_active();

    double now = sink_.clock();
    if (!force && now - session_->last_redraw < session_->refresh_interval) {
        return;
    }

    // resolve before moving last_redraw: producers may measure the interval
    std::string text = content.resolve();
    if (session_->show_elapsed) {
        text = format_duration(std::max(now - start_, 0.0), 0, true) + ": " + text;
    }
    session_->last_redraw = now;
    write_line(text, false);
}

void ProgressReporter::finish(const ProgressContent& content) {
    require_active();

    bool show_elapsed = session_->show_elapsed;
    elapsed_ = std::max(sink_.clock() - start_, MIN_ELAPSED_SEC);
    session_.reset();

    std::string text = content.resolve();
    if (show_elapsed) {
        text = format_duration(elapsed_, 0, true) + ": " + text;
    }
    write_line(text, true);
}

double ProgressReporter::elapsed() const {
    if (session_) throw IllegalState("elapsed time is only known after finish");
    return elapsed_;
}

double ProgressReporter::refresh_interval() const {
    require_active();
    return session_->refresh_interval;
}

bool ProgressReporter::show_elapsed() const {
    require_active();
    return session_->show_elapsed;
}

double ProgressReporter::last_redraw_time() const {
    require_active();
    return session_->last_redraw;
}

void ProgressReporter::write_line(const std::string& text, bool newline) {
    // carriage return + clear to end of line, then the new text
    if (std::fprintf(sink_.out, "\r\x1b[K%s%s", text.c_str(), newline ? "\n" : "") < 0 ||
        std::fflush(sink_.out) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot write progress output");
    }
}

} // namespace humanfmt
