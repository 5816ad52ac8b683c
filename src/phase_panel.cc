// phase_panel.cc
#include "phase_panel.h"
#include <stdexcept>

namespace stripplot {

PhasePanel::PhasePanel(std::size_t size,
                       std::pair<double, double> xlim,
                       std::pair<double, double> ylim,
                       PlotStyle style)
    : xs_(size), ys_(size), xlim_(xlim), ylim_(ylim), style_(std::move(style)) {
    if (!(xlim_.first < xlim_.second) || !(ylim_.first < ylim_.second)) {
        throw std::invalid_argument("Phase limits must satisfy min < max");
    }
}

void PhasePanel::update(double x, double y) {
    roll(PhaseAxis::X, x);
    roll(PhaseAxis::Y, y);
}

void PhasePanel::roll(PhaseAxis axis, double value) {
    (axis == PhaseAxis::X ? xs_ : ys_).append(value);
}

const RollingBuffer& PhasePanel::buffer(PhaseAxis axis) const {
    return axis == PhaseAxis::X ? xs_ : ys_;
}

std::vector<std::pair<double, double>> PhasePanel::points() const {
    std::vector<std::pair<double, double>> out;
    out.reserve(xs_.capacity());
    for (std::size_t i = 0; i < xs_.capacity(); ++i) {
        out.emplace_back(xs_.at(i), ys_.at(i));
    }
    return out;
}

}  // namespace stripplot
