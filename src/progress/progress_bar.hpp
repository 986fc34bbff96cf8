#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "progress/progress_reporter.hpp"
#include "term/terminal.hpp"

namespace humanfmt {

// How the displayed transfer rate is estimated.
//   kCumulative: bytes since start / time since start (stable)
//   kInstant   : bytes since last redraw / time since last redraw
enum class SpeedMode { kCumulative, kInstant };

// "cumulative" or "instant". Throws InvalidArgument otherwise.
SpeedMode parse_speed_mode(const std::string& name);
const char* speed_mode_name(SpeedMode mode);

// pv(1)-style byte progress bar on a single overwritable line:
//
//   2.02GiB 0:00:04 [ 424MiB/s] [=====>      ]  43% ETA 0:00:05
//
// Fields: processed size, elapsed time, speed, bar, percentage, ETA.
// The preprocessed part of the total counts towards the percentage but not
// towards the speed. Built on a ProgressReporter without the elapsed prefix.
class ProgressBar {
public:
    // Throws InvalidArgument if total_size is zero or preprocessed exceeds
    // it. columns is read once; unknown or narrow terminals get a bar of
    // BAR_FALLBACK_WIDTH characters. Draws the initial bar.
    explicit ProgressBar(uint64_t total_size,
                         uint64_t preprocessed = 0,
                         double refresh_interval = DEFAULT_BAR_INTERVAL,
                         SpeedMode speed_mode = SpeedMode::kCumulative,
                         ProgressSink sink = {},
                         std::optional<int> columns = terminal_columns());

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    // Add a newly processed chunk (clamped to the total) and redraw if the
    // refresh interval has passed.
    void update(uint64_t chunk_size);

    // Overwrite the processed size (clamped to [preprocessed, total]) and
    // redraw unconditionally.
    void force_update(uint64_t processed_size);

    // Draw the completed bar (full, 100%, no ETA) with a newline and enter
    // the Finished state. The bar is Finished even if the final write
    // throws; the terminal line then lacks its newline.
    void finish();

    bool finished() const { return reporter_.finished(); }

    uint64_t total_size() const { return total_; }
    uint64_t preprocessed_size() const { return preprocessed_; }
    double start_time() const { return reporter_.start_time(); }
    double elapsed() const { return reporter_.elapsed(); }

    // Active state only.
    uint64_t processed_size() const;
    SpeedMode speed_mode() const;
    int bar_width() const;

    // Width of the bar itself for a terminal of the given column count.
    static int bar_width_for(std::optional<int> columns);

private:
    struct Tracking {
        uint64_t processed;
        SpeedMode speed_mode;
        uint64_t last_processed;  // at the last redraw, for kInstant
    };

    uint64_t total_;
    uint64_t preprocessed_;
    int bar_width_;
    std::optional<Tracking> tracking_;  // empty once finished
    ProgressReporter reporter_;

    const Tracking& tracking() const;
    std::string render();
    std::string render_finished() const;
};

// Assemble one bar line from its already formatted fields.
std::string format_bar_line(const std::string& processed, const std::string& elapsed,
                            const std::string& speed, const std::string& bar,
                            int percent, const std::string& eta);

// The bar field: "====>    " with the arrow at the leading edge, or all
// spaces when nothing is filled yet.
std::string render_bar(int width, double fraction);

} // namespace humanfmt
