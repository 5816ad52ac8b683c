#pragma once

#include <mutex>
#include <string>
#include "plot_engine.h"
#include "plot_session.h"

namespace stripplot {

// Real-time scrolling multi-row plot. Acquisition should run on its own
// thread and publish through the value accessor (see LatestValues) so that
// it never waits on drawing.
class RealtimePlotter {
public:
    RealtimePlotter(PlotConfig config, ValueAccessor get_values);

    // Opens the window and renders until it is closed.
    void start();

    // Safe from any thread.
    void show_baseline(long row, double value);
    void show_baseline(long row);
    void hide_baseline(long row);
    bool is_open() const { return engine_.is_open(); }

    std::size_t row_count() const { return engine_.row_count(); }

    PlotEngine& engine() { return engine_; }

private:
    void check_row(long row) const;

    PlotEngine engine_;
    PlotSession session_;
    std::mutex engine_mutex_;
};

}  // namespace stripplot
