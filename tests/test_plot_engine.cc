#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>
#include "plot_engine.h"
#include "plot_errors.h"

using namespace stripplot;

namespace {

// Replays a scripted list of frames, one per pull.
struct ScriptedSource {
    std::vector<std::optional<ValueFrame>> frames;
    std::size_t next = 0;
    std::size_t pulls = 0;

    ValueAccessor accessor() {
        return [this]() -> std::optional<ValueFrame> {
            ++pulls;
            if (next >= frames.size()) return std::nullopt;
            return frames[next++];
        };
    }
};

class FakeWindow : public CloseNotifier {
public:
    void on_close(std::function<void()> handler) override { handlers.push_back(std::move(handler)); }
    void close() {
        for (auto& h : handlers) h();
    }
    std::vector<std::function<void()>> handlers;
};

PlotConfig two_rows(std::size_t size = 4) {
    PlotConfig config;
    config.ylims = {{-1, 1}, {-1, 1}};
    config.size = size;
    return config;
}

bool contains(const FrameUpdate& f, Drawable d) {
    return std::find(f.drawables.begin(), f.drawables.end(), d) != f.drawables.end();
}

ValueAccessor constant(ValueFrame values) {
    return [values]() -> std::optional<ValueFrame> { return values; };
}

}  // namespace

TEST(PlotEngine, end_to_end_two_rows) {
    ScriptedSource src;
    src.frames = {ValueFrame{0, 0}, ValueFrame{0.5, -0.5}, ValueFrame{1, -1},
                  ValueFrame{0, 0}, ValueFrame{-1, 1}};
    PlotEngine engine(two_rows(4), src.accessor());

    for (int i = 0; i < 5; ++i) engine.update();

    EXPECT_EQ(engine.row(0).series()[0].buffer.contents(), (std::vector<double>{0.5, 1, 0, -1}));
    EXPECT_EQ(engine.row(1).series()[0].buffer.contents(), (std::vector<double>{-0.5, -1, 0, 1}));
    EXPECT_EQ(engine.frame_count(), 5u);
}

TEST(PlotEngine, defaults_for_omitted_lists) {
    PlotEngine engine(two_rows(), constant({0, 0}));
    ASSERT_EQ(engine.row_count(), 2u);
    for (const auto& row : engine.rows()) {
        ASSERT_EQ(row.series_count(), 1u);
        EXPECT_EQ(row.series()[0].style.spec, "b-");
        EXPECT_EQ(row.label(), "");
        EXPECT_FALSE(row.has_grid());
        EXPECT_FALSE(row.readout_enabled());
        EXPECT_EQ(row.series()[0].buffer.capacity(), 4u);
    }
    EXPECT_EQ(engine.phase_panel(), nullptr);
    EXPECT_EQ(engine.config().interval_msec, 20);
}

TEST(PlotEngine, style_count_mismatch) {
    PlotConfig config;
    config.ylims = {{-1, 1}, {-1, 1}, {0, 5}};
    config.styles = {"r-", "b-"};
    try {
        PlotEngine engine(config, constant({0, 0, 0}));
        FAIL() << "expected ConfigurationMismatch";
    } catch (const ConfigurationMismatch& e) {
        EXPECT_EQ(e.expected(), 3u);
        EXPECT_EQ(e.actual(), 2u);
        EXPECT_EQ(e.list_name(), "styles");
    }

    config.styles = {"r-", "b-", "g."};
    EXPECT_NO_THROW(PlotEngine(config, constant({0, 0, 0})));
}

TEST(PlotEngine, other_list_mismatches) {
    PlotConfig labels = two_rows();
    labels.ylabels = {"only one"};
    EXPECT_THROW(PlotEngine(labels, constant({0, 0})), ConfigurationMismatch);

    PlotConfig ticks = two_rows();
    ticks.yticks = {{0}, {0}, {0}};
    EXPECT_THROW(PlotEngine(ticks, constant({0, 0})), ConfigurationMismatch);

    PlotConfig legends = two_rows();
    legends.styles = {"r-", std::vector<std::string>{"g-", "m-"}};
    legends.legends = {{"a"}, {"b"}};
    EXPECT_THROW(PlotEngine(legends, constant({0, 0, 0})), ConfigurationMismatch);
}

TEST(PlotEngine, invalid_parameters) {
    PlotConfig empty;
    EXPECT_THROW(PlotEngine(empty, constant({})), std::invalid_argument);

    PlotConfig inverted;
    inverted.ylims = {{1, -1}};
    EXPECT_THROW(PlotEngine(inverted, constant({0})), std::invalid_argument);

    PlotConfig zero = two_rows(0);
    EXPECT_THROW(PlotEngine(zero, constant({0, 0})), std::invalid_argument);

    PlotConfig bad_style = two_rows();
    bad_style.styles = {"b-", "zz"};
    EXPECT_THROW(PlotEngine(bad_style, constant({0, 0})), std::invalid_argument);

    EXPECT_THROW(PlotEngine(two_rows(), ValueAccessor()), std::invalid_argument);
}

TEST(PlotEngine, baseline_out_of_range) {
    PlotEngine engine(two_rows(), constant({0, 0}));
    EXPECT_THROW(engine.show_baseline(-1, 0), IndexOutOfRange);
    EXPECT_THROW(engine.show_baseline(2, 0), IndexOutOfRange);
    EXPECT_THROW(engine.hide_baseline(2), IndexOutOfRange);

    try {
        engine.show_baseline(5, 1.0);
        FAIL() << "expected IndexOutOfRange";
    } catch (const IndexOutOfRange& e) {
        EXPECT_EQ(e.index(), 5);
        EXPECT_EQ(e.row_count(), 2u);
        EXPECT_NE(std::string(e.what()).find("[0,2)"), std::string::npos);
    }

    EXPECT_FALSE(engine.row(0).baseline_visible());
    EXPECT_FALSE(engine.row(1).baseline_visible());
}

TEST(PlotEngine, hidden_baseline_not_drawn) {
    PlotEngine engine(two_rows(), constant({0.1, 0.2}));

    engine.show_baseline(1, 0.5);
    FrameUpdate shown = engine.update();
    EXPECT_TRUE(contains(shown, {DrawableKind::BASELINE, 1}));
    EXPECT_FALSE(contains(shown, {DrawableKind::BASELINE, 0}));

    engine.hide_baseline(1);
    FrameUpdate hidden = engine.update();
    EXPECT_FALSE(contains(hidden, {DrawableKind::BASELINE, 1}));
    EXPECT_DOUBLE_EQ(engine.row(1).baseline_value(), 0.5);

    engine.show_baseline(1);
    FrameUpdate again = engine.update();
    EXPECT_TRUE(contains(again, {DrawableKind::BASELINE, 1}));
    EXPECT_DOUBLE_EQ(engine.row(1).baseline_value(), 0.5);
}

TEST(PlotEngine, waiting_until_data_arrives) {
    ScriptedSource src;
    src.frames = {std::nullopt, std::nullopt, std::nullopt, ValueFrame{0.3, 0.4}};
    PlotConfig config = two_rows();
    config.window_name = "Demo";
    PlotEngine engine(config, src.accessor());

    for (int i = 0; i < 3; ++i) {
        FrameUpdate f = engine.update();
        EXPECT_TRUE(f.waiting);
        EXPECT_TRUE(engine.waiting());
        ASSERT_EQ(f.drawables.size(), 1u);
        EXPECT_EQ(f.drawables[0].kind, DrawableKind::TITLE);
    }
    EXPECT_EQ(engine.title(), "Demo (waiting for data)");
    for (const auto& row : engine.rows()) {
        EXPECT_EQ(row.series()[0].buffer.contents(), std::vector<double>(4, 0.0));
        EXPECT_EQ(row.series()[0].buffer.append_count(), 0u);
    }
    EXPECT_EQ(engine.frame_count(), 0u);

    FrameUpdate live = engine.update();
    EXPECT_FALSE(live.waiting);
    EXPECT_FALSE(engine.waiting());
    EXPECT_EQ(engine.title(), "Demo");
    EXPECT_TRUE(contains(live, {DrawableKind::TITLE}));
    EXPECT_DOUBLE_EQ(engine.row(0).series()[0].buffer.latest(), 0.3);
    EXPECT_DOUBLE_EQ(engine.row(1).series()[0].buffer.latest(), 0.4);
}

TEST(PlotEngine, title_only_sent_on_transition) {
    PlotEngine engine(two_rows(), constant({0, 0}));
    EXPECT_TRUE(contains(engine.update(), {DrawableKind::TITLE}));
    EXPECT_FALSE(contains(engine.update(), {DrawableKind::TITLE}));
}

TEST(PlotEngine, value_count_mismatch_is_fatal) {
    PlotEngine engine(two_rows(), constant({1, 2, 3}));
    try {
        engine.update();
        FAIL() << "expected ValueCountMismatch";
    } catch (const ValueCountMismatch& e) {
        EXPECT_EQ(e.expected(), 2u);
        EXPECT_EQ(e.received(), 3u);
    }
    EXPECT_EQ(engine.row(0).series()[0].buffer.append_count(), 0u);

    PlotEngine short_engine(two_rows(), constant({1}));
    EXPECT_THROW(short_engine.update(), ValueCountMismatch);
}

TEST(PlotEngine, phase_prefix_and_overlay_dispatch) {
    PlotConfig config;
    config.ylims = {{-1, 1}, {-5, 5}};
    config.size = 3;
    config.phaselims = PhaseLimits{{-2, 2}, {-3, 3}};
    config.styles = {std::vector<std::string>{"r-", "g-"}, "b."};
    config.legends = {{"left", "right"}, {}};

    PlotEngine engine(config, constant({0.7, -0.7, 0.1, 0.2, 0.3}));
    EXPECT_EQ(engine.total_series_count(), 3u);
    EXPECT_EQ(engine.expected_value_count(), 5u);

    FrameUpdate f = engine.update();

    const PhasePanel* phase = engine.phase_panel();
    ASSERT_NE(phase, nullptr);
    EXPECT_DOUBLE_EQ(phase->buffer(PhaseAxis::X).latest(), 0.7);
    EXPECT_DOUBLE_EQ(phase->buffer(PhaseAxis::Y).latest(), -0.7);
    EXPECT_EQ(phase->xlim(), std::make_pair(-2.0, 2.0));

    EXPECT_DOUBLE_EQ(engine.row(0).series()[0].buffer.latest(), 0.1);
    EXPECT_DOUBLE_EQ(engine.row(0).series()[1].buffer.latest(), 0.2);
    EXPECT_DOUBLE_EQ(engine.row(1).series()[0].buffer.latest(), 0.3);
    EXPECT_EQ(engine.row(0).series()[1].label, "right");

    ASSERT_GE(f.drawables.size(), 4u);
    EXPECT_EQ(f.drawables[0].kind, DrawableKind::PHASE_SCATTER);
    EXPECT_EQ(f.drawables[1], (Drawable{DrawableKind::LINE, 0, 0}));
    EXPECT_EQ(f.drawables[2], (Drawable{DrawableKind::LINE, 0, 1}));
    EXPECT_EQ(f.drawables[3], (Drawable{DrawableKind::LINE, 1, 0}));
}

TEST(PlotEngine, readouts_reported_when_enabled) {
    PlotConfig config = two_rows();
    config.show_readouts = true;
    PlotEngine engine(config, constant({1.234, -2}));
    FrameUpdate f = engine.update();
    EXPECT_TRUE(contains(f, {DrawableKind::READOUT, 0}));
    EXPECT_TRUE(contains(f, {DrawableKind::READOUT, 1}));
    EXPECT_EQ(engine.row(0).readout(), "+1.234000");
    EXPECT_EQ(engine.row(1).readout(), "-2.000000");
}

TEST(PlotEngine, close_stops_mutation) {
    FakeWindow window;
    ScriptedSource src;
    src.frames = {ValueFrame{1, 1}, ValueFrame{2, 2}};
    PlotEngine engine(two_rows(), src.accessor());
    engine.attach(window);
    ASSERT_EQ(window.handlers.size(), 1u);

    engine.update();
    EXPECT_TRUE(engine.is_open());

    window.close();
    EXPECT_FALSE(engine.is_open());

    FrameUpdate f = engine.update();
    EXPECT_TRUE(f.drawables.empty());
    EXPECT_EQ(src.pulls, 1u);
    EXPECT_DOUBLE_EQ(engine.row(0).series()[0].buffer.latest(), 1.0);

    window.close();
    EXPECT_FALSE(engine.is_open());
}

TEST(PlotEngine, attaches_only_once) {
    FakeWindow a, b;
    PlotEngine engine(two_rows(), constant({0, 0}));
    engine.attach(a);
    EXPECT_THROW(engine.attach(b), std::logic_error);
}

TEST(PlotEngine, pull_skips_accessor_once_closed) {
    ScriptedSource src;
    src.frames = {ValueFrame{1, 1}};
    PlotEngine engine(two_rows(), src.accessor());
    engine.handle_close();

    EXPECT_FALSE(engine.pull().has_value());
    EXPECT_EQ(src.pulls, 0u);
    EXPECT_TRUE(engine.apply(ValueFrame{1, 1}).drawables.empty());
    EXPECT_EQ(engine.row(0).series()[0].buffer.latest(), 0.0);
}

TEST(PlotEngine, accessor_may_change_baselines) {
    std::mutex engine_mutex;
    PlotEngine* self = nullptr;
    PlotEngine engine(two_rows(), [&]() -> std::optional<ValueFrame> {
        std::lock_guard<std::mutex> lock(engine_mutex);
        self->show_baseline(1, -0.5);
        return ValueFrame{0, 0};
    });
    self = &engine;

    std::optional<ValueFrame> values = engine.pull();
    std::lock_guard<std::mutex> lock(engine_mutex);
    FrameUpdate frame = engine.apply(std::move(values));
    EXPECT_TRUE(contains(frame, {DrawableKind::BASELINE, 1}));
    EXPECT_DOUBLE_EQ(engine.row(1).baseline_value(), -0.5);
}

TEST(PlotEngine, baseline_calls_race_a_locking_accessor) {
    // host_mutex stands in for a lock the accessor's runtime needs (an
    // interpreter lock), also held by the thread making baseline calls.
    std::mutex host_mutex;
    std::mutex engine_mutex;
    PlotEngine engine(two_rows(), [&]() -> std::optional<ValueFrame> {
        std::lock_guard<std::mutex> host(host_mutex);
        return ValueFrame{0.5, -0.5};
    });

    std::atomic<bool> stop{false};
    std::atomic<int> frames{0};
    std::thread render([&]() {
        while (!stop.load()) {
            std::optional<ValueFrame> values = engine.pull();
            std::lock_guard<std::mutex> lock(engine_mutex);
            engine.apply(std::move(values));
            ++frames;
        }
    });

    for (int i = 0; i < 500; ++i) {
        std::lock_guard<std::mutex> host(host_mutex);
        std::lock_guard<std::mutex> lock(engine_mutex);
        if (i % 2 == 0) {
            engine.show_baseline(0, 0.25);
        } else {
            engine.hide_baseline(0);
        }
    }
    while (frames.load() == 0) std::this_thread::yield();
    stop.store(true);
    render.join();

    EXPECT_FALSE(engine.row(0).baseline_visible());
    EXPECT_DOUBLE_EQ(engine.row(0).series()[0].buffer.latest(), 0.5);
}

TEST(PlotEngine, gap_after_live_data_keeps_content) {
    ScriptedSource src;
    src.frames = {ValueFrame{0.5, -0.5}, std::nullopt};
    PlotEngine engine(two_rows(2), src.accessor());
    engine.show_baseline(0, 0.1);
    engine.show_baseline(1, 0.2);
    engine.hide_baseline(1);

    FrameUpdate live = engine.update();
    EXPECT_FALSE(live.waiting);

    FrameUpdate gap = engine.update();
    EXPECT_TRUE(gap.waiting);
    EXPECT_EQ(gap.drawables, (std::vector<Drawable>{{DrawableKind::TITLE}}));
    EXPECT_EQ(engine.frame_count(), 1u);

    std::vector<Drawable> content = engine.content_drawables();
    std::vector<Drawable> expected = {{DrawableKind::LINE, 0, 0},
                                      {DrawableKind::LINE, 1, 0},
                                      {DrawableKind::BASELINE, 0}};
    EXPECT_EQ(content, expected);
    EXPECT_EQ(engine.row(0).series()[0].buffer.contents(), (std::vector<double>{0, 0.5}));
}
