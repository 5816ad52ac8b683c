// series_binding.h
#pragma once

#include <string>
#include <utility>
#include "plot_style.h"
#include "rolling_buffer.h"

namespace stripplot {

// One plotted line: style tag, legend label (may be empty) and its window.
struct SeriesBinding {
    SeriesBinding(PlotStyle s, std::string l, std::size_t size)
        : style(std::move(s)), label(std::move(l)), buffer(size) {}

    const PlotStyle style;
    const std::string label;
    RollingBuffer buffer;
};

}  // namespace stripplot
