// axis_row.cc
#include "axis_row.h"
#include "plot_errors.h"
#include <cstdio>
#include <stdexcept>

namespace stripplot {

std::string format_readout(double value) {
    char text[64];
    std::snprintf(text, sizeof(text), "%+f", value);
    return text;
}

AxisRow::AxisRow(std::size_t index,
                 std::pair<double, double> ylim,
                 std::vector<SeriesBinding> series,
                 std::string label,
                 std::vector<double> ticks,
                 bool readout)
    : index_(index), ylim_(ylim), series_(std::move(series)),
      label_(std::move(label)), ticks_(std::move(ticks)), readout_enabled_(readout) {
    if (!(ylim_.first < ylim_.second)) {
        throw std::invalid_argument("Row " + std::to_string(index_) + ": ymin must be < ymax");
    }
    if (series_.empty()) {
        throw std::invalid_argument("Row " + std::to_string(index_) + " has no series");
    }
}

void AxisRow::update(const double* values, std::size_t count) {
    if (count != series_.size()) {
        throw ValueCountMismatch(series_.size(), count);
    }

    for (std::size_t i = 0; i < count; ++i) {
        series_[i].buffer.append(values[i]);
    }

    if (readout_enabled_) {
        readout_.clear();
        for (std::size_t i = 0; i < count; ++i) {
            if (i) readout_ += "  ";
            readout_ += format_readout(values[i]);
        }
    }
}

void AxisRow::show_baseline(double value) {
    baseline_value_ = value;
    baseline_visible_ = true;
}

void AxisRow::show_baseline() {
    baseline_visible_ = true;
}

void AxisRow::hide_baseline() {
    baseline_visible_ = false;
}

bool AxisRow::has_legend() const {
    for (const auto& s : series_) {
        if (!s.label.empty()) return true;
    }
    return false;
}

}  // namespace stripplot
