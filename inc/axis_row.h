// axis_row.h
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "series_binding.h"

namespace stripplot {

// Fixed-precision signed readout text, e.g. "+1.234000".
std::string format_readout(double value);

// One chart row: a y-range shared by one or more overlaid series, plus an
// optional constant baseline and an optional live numeric readout.
class AxisRow {
public:
    AxisRow(std::size_t index,
            std::pair<double, double> ylim,
            std::vector<SeriesBinding> series,
            std::string label = "",
            std::vector<double> ticks = {},
            bool readout = false);

    // One value per bound series, in binding order.
    void update(const double* values, std::size_t count);

    void show_baseline(double value);
    void show_baseline();  // re-show the last stored level
    void hide_baseline();

    bool baseline_visible() const { return baseline_visible_; }
    double baseline_value() const { return baseline_value_; }

    std::size_t index() const { return index_; }
    const std::pair<double, double>& ylim() const { return ylim_; }
    const std::vector<SeriesBinding>& series() const { return series_; }
    std::size_t series_count() const { return series_.size(); }
    const std::string& label() const { return label_; }
    const std::vector<double>& ticks() const { return ticks_; }
    bool has_grid() const { return !ticks_.empty(); }
    bool has_legend() const;

    bool readout_enabled() const { return readout_enabled_; }
    const std::string& readout() const { return readout_; }

private:
    std::size_t index_;
    std::pair<double, double> ylim_;
    std::vector<SeriesBinding> series_;
    std::string label_;
    std::vector<double> ticks_;

    double baseline_value_ = 0.0;
    bool baseline_visible_ = false;

    bool readout_enabled_ = false;
    std::string readout_;
};

}  // namespace stripplot
