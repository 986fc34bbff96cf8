#include "progress/progress_bar.hpp"

#include <algorithm>
#include <cmath>

#include "core/errors.hpp"
#include "format/duration_formatter.hpp"
#include "format/size_formatter.hpp"

namespace humanfmt {

// Largest ETA format_duration accepts; anything beyond reads as unknown.
static constexpr double kMaxEtaSec = 9.0e18;

SpeedMode parse_speed_mode(const std::string& name) {
    if (name == "cumulative") return SpeedMode::kCumulative;
    if (name == "instant") return SpeedMode::kInstant;
    throw InvalidArgument("expected cumulative or instant; " + name + " received");
}

const char* speed_mode_name(SpeedMode mode) {
    return mode == SpeedMode::kInstant ? "instant" : "cumulative";
}

static uint64_t check_total(uint64_t total_size, uint64_t preprocessed) {
    if (total_size == 0) {
        throw InvalidArgument("total size must be positive; got 0");
    }
    if (preprocessed > total_size) {
        throw InvalidArgument("preprocessed size " + std::to_string(preprocessed) +
                              " exceeds total size " + std::to_string(total_size));
    }
    return total_size;
}

static std::string right_align(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    return std::string(width - s.size(), ' ') + s;
}

static std::string elapsed_field(double seconds) {
    return format_duration(std::max(seconds, 0.0), 0, true);
}

std::string format_bar_line(const std::string& processed, const std::string& elapsed,
                            const std::string& speed, const std::string& bar,
                            int percent, const std::string& eta) {
    std::string line;
    line += right_align(processed, 7);
    line += ' ';
    line += elapsed;
    line += " [";
    line += right_align(speed, 7);
    line += "/s] [";
    line += bar;
    line += "] ";
    line += right_align(std::to_string(percent), 3);
    line += "% ";
    line += eta;
    return line;
}

std::string render_bar(int width, double fraction) {
    auto length = static_cast<int>(std::nearbyint(width * fraction));
    length = std::clamp(length, 0, width);
    if (length == 0) return std::string(static_cast<size_t>(width), ' ');
    return std::string(static_cast<size_t>(length - 1), '=') + '>' +
           std::string(static_cast<size_t>(width - length), ' ');
}

int ProgressBar::bar_width_for(std::optional<int> columns) {
    if (!columns || *columns < BAR_MIN_TERMINAL_COLUMNS) return BAR_FALLBACK_WIDTH;
    return *columns - BAR_RESERVED_COLUMNS;
}

ProgressBar::ProgressBar(uint64_t total_size, uint64_t preprocessed,
                         double refresh_interval, SpeedMode speed_mode,
                         ProgressSink sink, std::optional<int> columns)
    : total_(check_total(total_size, preprocessed)),
      preprocessed_(preprocessed),
      bar_width_(bar_width_for(columns)),
      tracking_(Tracking{preprocessed, speed_mode, preprocessed}),
      reporter_(refresh_interval, false, "", std::move(sink)) {
    reporter_.update([this] { return render(); }, true);
}

const ProgressBar::Tracking& ProgressBar::tracking() const {
    if (!tracking_) throw IllegalState("operation on finished progress bar");
    return *tracking_;
}

uint64_t ProgressBar::processed_size() const {
    return tracking().processed;
}

SpeedMode ProgressBar::speed_mode() const {
    return tracking().speed_mode;
}

int ProgressBar::bar_width() const {
    tracking();
    return bar_width_;
}

void ProgressBar::update(uint64_t chunk_size) {
    tracking();
    Tracking& t = *tracking_;
    if (chunk_size >= total_ - t.processed) {
        t.processed = total_;
    } else {
        t.processed += chunk_size;
    }
    reporter_.update([this] { return render(); });
}

void ProgressBar::force_update(uint64_t processed_size) {
    tracking();
    tracking_->processed = std::clamp(processed_size, preprocessed_, total_);
    reporter_.update([this] { return render(); }, true);
}

void ProgressBar::finish() {
    tracking();
    tracking_.reset();
    reporter_.finish([this] { return render_finished(); });
}

std::string ProgressBar::render() {
    Tracking& t = *tracking_;
    double now = reporter_.now();

    double speed;
    if (t.speed_mode == SpeedMode::kInstant) {
        double since_last = std::max(now - reporter_.last_redraw_time(), MIN_ELAPSED_SEC);
        speed = t.processed > t.last_processed
                    ? static_cast<double>(t.processed - t.last_processed) / since_last
                    : 0.0;
    } else {
        double elapsed = std::max(now - reporter_.start_time(), MIN_ELAPSED_SEC);
        speed = static_cast<double>(t.processed - preprocessed_) / elapsed;
    }
    t.last_processed = t.processed;

    double fraction = static_cast<double>(t.processed) / static_cast<double>(total_);
    int percent = static_cast<int>(fraction * 100);

    std::string eta = "ETA unknown";
    if (speed > 0) {
        double remaining = static_cast<double>(total_ - t.processed) / speed;
        if (remaining < kMaxEtaSec) eta = "ETA " + elapsed_field(remaining);
    }

    return format_bar_line(format_size(t.processed),
                           elapsed_field(now - reporter_.start_time()),
                           format_size(speed),
                           render_bar(bar_width_, fraction),
                           percent, eta);
}

std::string ProgressBar::render_finished() const {
    double elapsed = reporter_.elapsed();
    double speed = static_cast<double>(total_ - preprocessed_) / elapsed;
    return format_bar_line(format_size(total_),
                           elapsed_field(elapsed),
                           format_size(speed),
                           std::string(static_cast<size_t>(bar_width_ - 1), '=') + '>',
                           100,
                           std::string(ETA_FIELD_WIDTH, ' '));
}

} // namespace humanfmt
