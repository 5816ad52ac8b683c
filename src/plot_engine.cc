// plot_engine.cc
#include "plot_engine.h"
#include "plot_errors.h"
#include <stdexcept>

namespace stripplot {

namespace {

template <typename T>
void check_row_list(const std::vector<T>& list, std::size_t nrows, const char* name) {
    if (!list.empty() && list.size() != nrows) {
        throw ConfigurationMismatch(name, nrows, list.size());
    }
}

}  // namespace

PlotEngine::PlotEngine(PlotConfig config, ValueAccessor get_values)
    : config_(std::move(config)), get_values_(std::move(get_values)) {
    const std::size_t nrows = config_.ylims.size();

    if (nrows == 0) throw std::invalid_argument("At least one y-range is required");
    if (config_.size == 0) throw std::invalid_argument("Window size must be > 0");
    if (config_.interval_msec <= 0) throw std::invalid_argument("Redraw interval must be > 0 msec");
    if (!get_values_) throw std::invalid_argument("A value accessor is required");

    check_row_list(config_.styles, nrows, "styles");
    check_row_list(config_.ylabels, nrows, "ylabels");
    check_row_list(config_.yticks, nrows, "yticks");
    check_row_list(config_.legends, nrows, "legends");

    rows_.reserve(nrows);
    for (std::size_t r = 0; r < nrows; ++r) {
        RowStyle row_style = config_.styles.empty() ? RowStyle("b-") : config_.styles[r];
        std::vector<PlotStyle> styles = row_style.resolve();

        std::vector<std::string> labels(styles.size());
        if (!config_.legends.empty() && !config_.legends[r].empty()) {
            const auto& given = config_.legends[r];
            if (given.size() != styles.size()) {
                throw ConfigurationMismatch("legends for row " + std::to_string(r),
                                            styles.size(), given.size());
            }
            labels = given;
        }

        std::vector<SeriesBinding> series;
        series.reserve(styles.size());
        for (std::size_t s = 0; s < styles.size(); ++s) {
            series.emplace_back(styles[s], labels[s], config_.size);
        }
        series_count_ += series.size();

        rows_.emplace_back(r, config_.ylims[r], std::move(series),
                           config_.ylabels.empty() ? std::string() : config_.ylabels[r],
                           config_.yticks.empty() ? std::vector<double>() : config_.yticks[r],
                           config_.show_readouts);
    }

    if (config_.phaselims) {
        phase_.emplace(config_.size, config_.phaselims->xlim, config_.phaselims->ylim);
    }
}

std::optional<ValueFrame> PlotEngine::pull() const {
    if (!is_open()) return std::nullopt;
    return get_values_();
}

FrameUpdate PlotEngine::apply(std::optional<ValueFrame> values) {
    FrameUpdate frame;
    if (!is_open()) return frame;

    if (!values) {
        waiting_ = true;
        frame.waiting = true;
        frame.drawables.push_back({DrawableKind::TITLE});
        return frame;
    }

    const std::size_t expected = expected_value_count();
    if (values->size() != expected) {
        throw ValueCountMismatch(expected, values->size());
    }

    const bool title_changed = waiting_;
    waiting_ = false;

    const double* v = values->data();
    if (phase_) {
        phase_->update(v[0], v[1]);
        v += 2;
    }
    for (auto& row : rows_) {
        row.update(v, row.series_count());
        v += row.series_count();
    }

    frame.drawables = content_drawables();
    if (title_changed) {
        frame.drawables.push_back({DrawableKind::TITLE});
    }

    ++frames_;
    return frame;
}

std::vector<Drawable> PlotEngine::content_drawables() const {
    std::vector<Drawable> out;
    if (phase_) {
        out.push_back({DrawableKind::PHASE_SCATTER});
    }

    for (const auto& row : rows_) {
        for (std::size_t s = 0; s < row.series_count(); ++s) {
            out.push_back({DrawableKind::LINE, static_cast<int>(row.index()), static_cast<int>(s)});
        }
    }

    for (const auto& row : rows_) {
        if (row.baseline_visible()) {
            out.push_back({DrawableKind::BASELINE, static_cast<int>(row.index())});
        }
    }

    for (const auto& row : rows_) {
        if (row.readout_enabled()) {
            out.push_back({DrawableKind::READOUT, static_cast<int>(row.index())});
        }
    }
    return out;
}

AxisRow& PlotEngine::checked_row(long index) {
    if (index < 0 || static_cast<std::size_t>(index) >= rows_.size()) {
        throw IndexOutOfRange(index, rows_.size());
    }
    return rows_[static_cast<std::size_t>(index)];
}

const AxisRow& PlotEngine::row(long index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= rows_.size()) {
        throw IndexOutOfRange(index, rows_.size());
    }
    return rows_[static_cast<std::size_t>(index)];
}

void PlotEngine::show_baseline(long row, double value) {
    checked_row(row).show_baseline(value);
}

void PlotEngine::show_baseline(long row) {
    checked_row(row).show_baseline();
}

void PlotEngine::hide_baseline(long row) {
    checked_row(row).hide_baseline();
}

void PlotEngine::attach(CloseNotifier& notifier) {
    if (attached_) {
        throw std::logic_error("PlotEngine is already attached to a window");
    }
    attached_ = true;
    notifier.on_close([this]() { handle_close(); });
}

void PlotEngine::handle_close() {
    open_.store(false);
}

std::string PlotEngine::title() const {
    if (!waiting_) return config_.window_name;
    if (config_.window_name.empty()) return "Waiting for data...";
    return config_.window_name + " (waiting for data)";
}

}  // namespace stripplot
