// plot.cc
#include "plot.h"
#include "plot_errors.h"

namespace stripplot {

RealtimePlotter::RealtimePlotter(PlotConfig config, ValueAccessor get_values)
    : engine_(std::move(config), std::move(get_values)),
      session_(engine_.config().window_name, engine_.config().line_thickness) {
    engine_.attach(session_);
}

void RealtimePlotter::start() {
    if (!engine_.is_open()) return;
    session_.run(engine_, engine_mutex_);
}

void RealtimePlotter::check_row(long row) const {
    // Row count never changes, so this needs no lock
    if (row < 0 || static_cast<std::size_t>(row) >= engine_.row_count()) {
        throw IndexOutOfRange(row, engine_.row_count());
    }
}

void RealtimePlotter::show_baseline(long row, double value) {
    check_row(row);
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_.show_baseline(row, value);
}

void RealtimePlotter::show_baseline(long row) {
    check_row(row);
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_.show_baseline(row);
}

void RealtimePlotter::hide_baseline(long row) {
    check_row(row);
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_.hide_baseline(row);
}

}  // namespace stripplot
