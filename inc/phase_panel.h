// phase_panel.h
#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "plot_style.h"
#include "rolling_buffer.h"

namespace stripplot {

enum class PhaseAxis { X, Y };

// Scatter of the last N (x, y) pairs of two channels. Not a time series:
// each axis shows one signal against its own fixed range.
class PhasePanel {
public:
    PhasePanel(std::size_t size,
               std::pair<double, double> xlim,
               std::pair<double, double> ylim,
               PlotStyle style = parse_style("o"));

    void update(double x, double y);

    // Shift-and-append on one axis only.
    void roll(PhaseAxis axis, double value);

    const RollingBuffer& buffer(PhaseAxis axis) const;
    std::vector<std::pair<double, double>> points() const;

    std::size_t size() const { return xs_.capacity(); }
    const std::pair<double, double>& xlim() const { return xlim_; }
    const std::pair<double, double>& ylim() const { return ylim_; }
    const PlotStyle& style() const { return style_; }

private:
    RollingBuffer xs_;
    RollingBuffer ys_;
    std::pair<double, double> xlim_;
    std::pair<double, double> ylim_;
    PlotStyle style_;
};

}  // namespace stripplot
