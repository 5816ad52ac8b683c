// plot_engine.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "axis_row.h"
#include "phase_panel.h"
#include "plot_style.h"
#include "value_source.h"

namespace stripplot {

struct PhaseLimits {
    std::pair<double, double> xlim;
    std::pair<double, double> ylim;
};

// Construction parameters. Per-row lists are optional: an empty list means
// "use the default for every row", otherwise it needs one entry per row.
struct PlotConfig {
    std::vector<std::pair<double, double>> ylims;
    std::size_t size = 100;
    std::optional<PhaseLimits> phaselims;
    std::string window_name;
    std::vector<RowStyle> styles;                  // default "b-"
    std::vector<std::string> ylabels;              // default ""
    std::vector<std::vector<double>> yticks;       // default none (no grid)
    std::vector<std::vector<std::string>> legends; // one label per overlaid series
    bool show_readouts = false;
    int interval_msec = 20;
    int line_thickness = 1;
};

enum class DrawableKind { PHASE_SCATTER, LINE, BASELINE, READOUT, TITLE };

// Handle to one element the renderer must redraw this frame.
struct Drawable {
    DrawableKind kind;
    int row = -1;
    int series = -1;

    bool operator==(const Drawable& o) const {
        return kind == o.kind && row == o.row && series == o.series;
    }
};

struct FrameUpdate {
    bool waiting = false;
    std::vector<Drawable> drawables;
};

class PlotEngine {
public:
    PlotEngine(PlotConfig config, ValueAccessor get_values);

    PlotEngine(const PlotEngine&) = delete;
    PlotEngine& operator=(const PlotEngine&) = delete;

    // One frame: pull values, roll every buffer, report what to redraw.
    FrameUpdate update() { return apply(pull()); }

    // The two halves of update(). pull() only calls the value accessor and
    // touches no engine state, so a caller that guards the engine with a
    // lock should pull before taking it. Returns nullopt once closed.
    std::optional<ValueFrame> pull() const;
    FrameUpdate apply(std::optional<ValueFrame> values);

    // Everything currently on the chart (phase scatter, lines, visible
    // baselines, readouts), without pulling or rolling.
    std::vector<Drawable> content_drawables() const;

    void show_baseline(long row, double value);
    void show_baseline(long row);
    void hide_baseline(long row);

    // Registers for the single close notification.
    void attach(CloseNotifier& notifier);
    void handle_close();
    bool is_open() const { return open_.load(); }

    bool waiting() const { return waiting_; }
    std::string title() const;

    std::size_t row_count() const { return rows_.size(); }
    const AxisRow& row(long index) const;
    const std::vector<AxisRow>& rows() const { return rows_; }
    const PhasePanel* phase_panel() const { return phase_ ? &*phase_ : nullptr; }

    std::size_t total_series_count() const { return series_count_; }
    std::size_t expected_value_count() const { return series_count_ + (phase_ ? 2 : 0); }
    std::uint64_t frame_count() const { return frames_; }
    const PlotConfig& config() const { return config_; }

private:
    AxisRow& checked_row(long index);

    PlotConfig config_;
    ValueAccessor get_values_;
    std::vector<AxisRow> rows_;
    std::optional<PhasePanel> phase_;
    std::size_t series_count_ = 0;

    std::atomic<bool> open_{true};
    bool attached_ = false;
    bool waiting_ = true;
    std::uint64_t frames_ = 0;
};

}  // namespace stripplot
