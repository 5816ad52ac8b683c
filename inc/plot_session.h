// plot_session.h
#pragma once

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "plot_engine.h"
#include "value_source.h"

namespace stripplot {

struct PixelRect {
    int x, y, width, height;
};

// Xlib render loop: ticks at the engine's interval, pulls one frame and
// repaints the elements the frame reports.
class PlotSession : public CloseNotifier {
public:
    PlotSession(const std::string& title = "", int line_thickness = 1);
    ~PlotSession() override;

    PlotSession(const PlotSession&) = delete;
    PlotSession& operator=(const PlotSession&) = delete;

    void on_close(std::function<void()> handler) override;

    // Blocks until the engine reports closed. Exceptions from
    // PlotEngine::update() propagate after the window is torn down.
    void run(PlotEngine& engine, std::mutex& engine_mutex);

    // Delivers the close notification (at most once).
    void request_close();

private:
    void init_x11();
    void teardown();
    void handle_events();
    void layout(const PlotEngine& engine);

    void render_background(const PlotEngine& engine);
    void present(const PlotEngine& engine, const FrameUpdate& frame);
    void render_frame(const PlotEngine& engine, const FrameUpdate& frame);
    void draw_row_chrome(const AxisRow& row, const PixelRect& r);
    void draw_phase_chrome(const PhasePanel& phase, const PixelRect& r);
    void draw_title(const std::string& title, bool waiting);
    void draw_series(const AxisRow& row, std::size_t series, const PixelRect& r);
    void draw_baseline(const AxisRow& row, const PixelRect& r);
    void draw_readout(const AxisRow& row, const PixelRect& r);
    void draw_phase_points(const PhasePanel& phase, const PixelRect& r);
    void draw_marker(const PlotStyle& style, int x, int y);
    void apply_line_style(const PlotStyle& style);
    void set_clip(const PixelRect& r);
    void clear_clip();
    unsigned long display_color(unsigned long rgb) const;
    int text_width(const std::string& s) const;
    void save_pixmap_to_ppm(const char* filename);

    // X11 state
    Display* dpy_ = nullptr;
    Window win_ = 0;
    GC gc_ = 0;
    Pixmap pixmap_ = 0;      // frame being composed
    Pixmap background_ = 0;  // static chrome and title
    XFontStruct* font_ = nullptr;
    Atom wm_delete_ = 0;
    int screen_ = 0;
    int width_ = 1000;
    int height_ = 600;

    std::string window_title_;
    int line_thickness_ = 1;

    std::vector<PixelRect> row_rects_;
    PixelRect phase_rect_{0, 0, 0, 0};
    bool background_dirty_ = true;
    bool have_frame_ = false;
    bool save_requested_ = false;

    std::vector<std::function<void()>> close_handlers_;
    bool close_sent_ = false;
};

}  // namespace stripplot
