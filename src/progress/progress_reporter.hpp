#pragma once

#include <cstdio>
#include <functional>
#include <optional>

#include "core/config.hpp"
#include "progress/progress_content.hpp"

namespace humanfmt {

// Seconds on the steady clock.
double monotonic_seconds();

// Output stream and time source of a reporter.
struct ProgressSink {
    std::FILE* out = stderr;
    std::function<double()> clock = monotonic_seconds;
};

// Single overwritable status line, redrawn at most once per refresh
// interval and optionally prefixed with the elapsed time ("0:01:23: ").
//
// A reporter is Active from construction until finish(), which prints the
// last line with a trailing newline and makes it Finished for good. After
// that only start_time() and elapsed() may be called; everything else
// throws IllegalState. Not thread-safe.
class ProgressReporter {
public:
    enum class State { kActive, kFinished };

    // Performs one forced redraw of initial_text.
    // Throws InvalidArgument for a negative or NaN refresh interval.
    explicit ProgressReporter(double refresh_interval = DEFAULT_TEXT_INTERVAL,
                              bool show_elapsed = true,
                              const ProgressContent& initial_text = "",
                              ProgressSink sink = {});

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    // Redraw if forced or if refresh_interval has passed since the last
    // redraw; otherwise do nothing (a producer is not called).
    void update(const ProgressContent& content, bool force = false);

    // Print the final line and a newline, then enter the Finished state.
    // The elapsed time is recorded and the state switched before content is
    // resolved, so a producer may read elapsed(). If the producer or the
    // write throws, the exception propagates, the line is left without its
    // newline and the reporter stays Finished.
    void finish(const ProgressContent& content);

    State state() const { return session_ ? State::kActive : State::kFinished; }
    bool finished() const { return !session_; }

    double start_time() const { return start_; }

    // Total elapsed seconds (at least 1 ms). Finished state only.
    double elapsed() const;

    // Active state only.
    double refresh_interval() const;
    bool show_elapsed() const;
    double last_redraw_time() const;

    // Current time on the reporter's clock.
    double now() const { return sink_.clock(); }

private:
    struct Session {
        double refresh_interval;
        bool show_elapsed;
        double last_redraw;
    };

    ProgressSink sink_;
    double start_;
    std::optional<Session> session_;  // empty once finished
    double elapsed_ = 0.0;

    void require_active() const;
    void write_line(const std::string& text, bool newline);
};

} // namespace humanfmt
