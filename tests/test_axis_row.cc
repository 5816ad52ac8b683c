#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "axis_row.h"
#include "plot_errors.h"

using namespace stripplot;

namespace {

AxisRow make_row(std::size_t nseries, bool readout = false) {
    std::vector<SeriesBinding> series;
    for (std::size_t i = 0; i < nseries; ++i) {
        series.emplace_back(parse_style("b-"), "s" + std::to_string(i), 4);
    }
    return AxisRow(0, {-1.0, 1.0}, std::move(series), "Row", {-1, 0, 1}, readout);
}

}  // namespace

TEST(AxisRow, update_appends_one_value_per_series) {
    AxisRow row = make_row(2);
    double v1[] = {0.25, -0.25};
    double v2[] = {0.5, -0.5};
    row.update(v1, 2);
    row.update(v2, 2);

    EXPECT_EQ(row.series()[0].buffer.contents(), (std::vector<double>{0, 0, 0.25, 0.5}));
    EXPECT_EQ(row.series()[1].buffer.contents(), (std::vector<double>{0, 0, -0.25, -0.5}));
}

TEST(AxisRow, wrong_value_count_is_rejected) {
    AxisRow row = make_row(2);
    double v[] = {1.0, 2.0, 3.0};
    EXPECT_THROW(row.update(v, 3), ValueCountMismatch);
    EXPECT_EQ(row.series()[0].buffer.append_count(), 0u);
}

TEST(AxisRow, baseline_hide_keeps_value) {
    AxisRow row = make_row(1);
    EXPECT_FALSE(row.baseline_visible());

    row.show_baseline(0.75);
    EXPECT_TRUE(row.baseline_visible());
    EXPECT_DOUBLE_EQ(row.baseline_value(), 0.75);

    row.hide_baseline();
    EXPECT_FALSE(row.baseline_visible());
    EXPECT_DOUBLE_EQ(row.baseline_value(), 0.75);

    row.show_baseline();
    EXPECT_TRUE(row.baseline_visible());
    EXPECT_DOUBLE_EQ(row.baseline_value(), 0.75);
}

TEST(AxisRow, readout_tracks_latest_raw_value) {
    AxisRow row = make_row(1, true);
    EXPECT_TRUE(row.readout_enabled());
    EXPECT_EQ(row.readout(), "");

    double v[] = {1.234};
    row.update(v, 1);
    EXPECT_EQ(row.readout(), "+1.234000");

    double w[] = {-0.5};
    row.update(w, 1);
    EXPECT_EQ(row.readout(), "-0.500000");
}

TEST(AxisRow, overlay_readout_lists_every_series) {
    AxisRow row = make_row(2, true);
    double v[] = {1.0, -2.0};
    row.update(v, 2);
    EXPECT_EQ(row.readout(), "+1.000000  -2.000000");
}

TEST(AxisRow, readout_disabled_stays_empty) {
    AxisRow row = make_row(1, false);
    double v[] = {3.0};
    row.update(v, 1);
    EXPECT_EQ(row.readout(), "");
}

TEST(AxisRow, grid_follows_ticks) {
    AxisRow row = make_row(1);
    EXPECT_TRUE(row.has_grid());
    EXPECT_TRUE(row.has_legend());

    std::vector<SeriesBinding> series;
    series.emplace_back(parse_style("r-"), "", 4);
    AxisRow bare(1, {0.0, 5.0}, std::move(series));
    EXPECT_FALSE(bare.has_grid());
    EXPECT_FALSE(bare.has_legend());
    EXPECT_EQ(bare.label(), "");
}

TEST(AxisRow, invalid_range_is_rejected) {
    std::vector<SeriesBinding> series;
    series.emplace_back(parse_style("r-"), "", 4);
    EXPECT_THROW(AxisRow(0, {1.0, 1.0}, series), std::invalid_argument);
    EXPECT_THROW(AxisRow(0, {0.0, 1.0}, {}), std::invalid_argument);
}

TEST(ReadoutFormat, signed_fixed_precision) {
    EXPECT_EQ(format_readout(0.0), "+0.000000");
    EXPECT_EQ(format_readout(1.234), "+1.234000");
    EXPECT_EQ(format_readout(-10.5), "-10.500000");
}
