// plot_session.cc
#include "plot_session.h"
#include "render_guard.h"
#include <X11/keysym.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

namespace stripplot {

constexpr unsigned long COLOR_BG = 0x000000;
constexpr unsigned long COLOR_FG = 0xFFFFFF;
constexpr unsigned long COLOR_GRID = 0x404040;
constexpr unsigned long COLOR_BASELINE = 0xA0A0A0;
constexpr unsigned long COLOR_WAITING = 0xFFA500;

constexpr double LEFT_MARGIN = 0.08;
constexpr double RIGHT_MARGIN = 0.03;
constexpr double TOP_MARGIN = 0.08;
constexpr double BOTTOM_MARGIN = 0.05;
constexpr int MIN_TITLE_HEIGHT = 30;
constexpr int ROW_GAP = 24;
constexpr int PANEL_GAP = 70;
constexpr int LEGEND_BOX = 10;

static int log_x_error(Display* dpy, XErrorEvent* ev) {
    char text[256];
    XGetErrorText(dpy, ev->error_code, text, sizeof(text));
    std::cerr << "PlotSession: X11 error: " << text
              << " (request " << static_cast<int>(ev->request_code) << ")" << std::endl;
    return 0;
}

// Xlib exits the process once this returns; all that is left is to say why.
static int log_x_io_error(Display* dpy) {
    std::cerr << "PlotSession: lost connection to X display "
              << (dpy ? DisplayString(dpy) : "") << std::endl;
    return 0;
}

static int value_to_pixel(double v, double lo, double hi, int origin, int extent, bool invert) {
    double t = (v - lo) / (hi - lo);
    if (invert) t = 1.0 - t;
    double p = origin + t * extent;
    return static_cast<int>(std::clamp(p, -30000.0, 30000.0));
}

static int row_y(const AxisRow& row, const PixelRect& r, double v) {
    return value_to_pixel(v, row.ylim().first, row.ylim().second, r.y, r.height, true);
}

static int sample_x(const PixelRect& r, std::size_t i, std::size_t n) {
    return r.x + static_cast<int>(static_cast<double>(i) * r.width / static_cast<double>(n));
}

PlotSession::PlotSession(const std::string& title, int line_thickness)
    : window_title_(title), line_thickness_(std::max(1, line_thickness)) {}

PlotSession::~PlotSession() {
    teardown();
}

void PlotSession::on_close(std::function<void()> handler) {
    close_handlers_.push_back(std::move(handler));
}

void PlotSession::request_close() {
    if (close_sent_) return;
    close_sent_ = true;
    for (auto& h : close_handlers_) h();
}

void PlotSession::init_x11() {
    XSetErrorHandler(log_x_error);
    XSetIOErrorHandler(log_x_io_error);

    dpy_ = XOpenDisplay(nullptr);
    if (!dpy_) {
        throw std::runtime_error("PlotSession: unable to open X11 display");
    }

    screen_ = DefaultScreen(dpy_);
    win_ = XCreateSimpleWindow(dpy_, RootWindow(dpy_, screen_), 10, 10, width_, height_, 1,
                               BlackPixel(dpy_, screen_), BlackPixel(dpy_, screen_));
    XStoreName(dpy_, win_, window_title_.empty() ? "stripplot" : window_title_.c_str());
    XSelectInput(dpy_, win_, ExposureMask | KeyPressMask | StructureNotifyMask);

    wm_delete_ = XInternAtom(dpy_, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(dpy_, win_, &wm_delete_, 1);

    XMapWindow(dpy_, win_);
    gc_ = XCreateGC(dpy_, win_, 0, nullptr);

    font_ = XLoadQueryFont(dpy_, "fixed");
    if (font_) {
        XSetFont(dpy_, gc_, font_->fid);
    } else {
        std::cerr << "PlotSession: font 'fixed' not available, using server default" << std::endl;
    }

    pixmap_ = XCreatePixmap(dpy_, win_, width_, height_, DefaultDepth(dpy_, screen_));
    background_ = XCreatePixmap(dpy_, win_, width_, height_, DefaultDepth(dpy_, screen_));
    background_dirty_ = true;
}

void PlotSession::teardown() {
    if (!dpy_) return;
    if (font_) XFreeFont(dpy_, font_);
    if (pixmap_) XFreePixmap(dpy_, pixmap_);
    if (background_) XFreePixmap(dpy_, background_);
    if (gc_) XFreeGC(dpy_, gc_);
    if (win_) XDestroyWindow(dpy_, win_);
    XCloseDisplay(dpy_);
    font_ = nullptr;
    pixmap_ = background_ = 0;
    gc_ = 0;
    win_ = 0;
    dpy_ = nullptr;
}

void PlotSession::handle_events() {
    XEvent e;
    while (XPending(dpy_)) {
        XNextEvent(dpy_, &e);

        if (e.type == ConfigureNotify) {
            if (e.xconfigure.width != width_ || e.xconfigure.height != height_) {
                width_ = e.xconfigure.width;
                height_ = e.xconfigure.height;
                XFreePixmap(dpy_, pixmap_);
                XFreePixmap(dpy_, background_);
                pixmap_ = XCreatePixmap(dpy_, win_, width_, height_, DefaultDepth(dpy_, screen_));
                background_ = XCreatePixmap(dpy_, win_, width_, height_, DefaultDepth(dpy_, screen_));
                background_dirty_ = true;
                have_frame_ = false;
            }

        } else if (e.type == ClientMessage) {
            if (static_cast<Atom>(e.xclient.data.l[0]) == wm_delete_) {
                request_close();
            }

        } else if (e.type == KeyPress) {
            KeySym key = XLookupKeysym(&e.xkey, 0);
            if (key == XK_q || key == XK_Escape) {
                request_close();
            } else if (key == XK_s) {
                save_requested_ = true;
            }
        }
    }
}

void PlotSession::layout(const PlotEngine& engine) {
    const int title_h = std::max(MIN_TITLE_HEIGHT, static_cast<int>(height_ * TOP_MARGIN));
    const int left = static_cast<int>(width_ * LEFT_MARGIN);
    const int right = static_cast<int>(width_ * RIGHT_MARGIN);
    const int bottom = static_cast<int>(height_ * BOTTOM_MARGIN);

    int area_x = left;
    int area_w = std::max(1, width_ - left - right);
    const int area_y = title_h;
    const int area_h = std::max(1, height_ - title_h - bottom);

    if (engine.phase_panel()) {
        // Square phase panel in the left column, rows in the right one
        int half = std::max(1, (area_w - PANEL_GAP) / 2);
        int side = std::min(half, area_h);
        phase_rect_ = {area_x, area_y + (area_h - side) / 2, side, side};
        area_x += half + PANEL_GAP;
        area_w = std::max(1, area_w - half - PANEL_GAP);
    }

    const int n = static_cast<int>(engine.row_count());
    const int row_h = std::max(1, (area_h - ROW_GAP * (n - 1)) / n);

    row_rects_.clear();
    for (int i = 0; i < n; ++i) {
        row_rects_.push_back({area_x, area_y + i * (row_h + ROW_GAP), area_w, row_h});
    }
}

unsigned long PlotSession::display_color(unsigned long rgb) const {
    // Black series would vanish on the dark background
    return rgb == COLOR_BG ? COLOR_FG : rgb;
}

int PlotSession::text_width(const std::string& s) const {
    if (font_) return XTextWidth(font_, s.c_str(), static_cast<int>(s.size()));
    return static_cast<int>(s.size()) * 6;
}

void PlotSession::set_clip(const PixelRect& r) {
    XRectangle rect;
    rect.x = static_cast<short>(r.x);
    rect.y = static_cast<short>(r.y);
    rect.width = static_cast<unsigned short>(r.width + 1);
    rect.height = static_cast<unsigned short>(r.height + 1);
    XSetClipRectangles(dpy_, gc_, 0, 0, &rect, 1, Unsorted);
}

void PlotSession::clear_clip() {
    XSetClipMask(dpy_, gc_, None);
}

void PlotSession::apply_line_style(const PlotStyle& style) {
    static const char dashed[] = {8, 4};
    static const char dash_dot[] = {8, 3, 2, 3};
    static const char dotted[] = {2, 3};

    switch (style.line) {
        case LineStyle::DASHED:
            XSetLineAttributes(dpy_, gc_, line_thickness_, LineOnOffDash, CapButt, JoinMiter);
            XSetDashes(dpy_, gc_, 0, dashed, 2);
            break;
        case LineStyle::DASH_DOT:
            XSetLineAttributes(dpy_, gc_, line_thickness_, LineOnOffDash, CapButt, JoinMiter);
            XSetDashes(dpy_, gc_, 0, dash_dot, 4);
            break;
        case LineStyle::DOTTED:
            XSetLineAttributes(dpy_, gc_, line_thickness_, LineOnOffDash, CapButt, JoinMiter);
            XSetDashes(dpy_, gc_, 0, dotted, 2);
            break;
        default:
            XSetLineAttributes(dpy_, gc_, line_thickness_, LineSolid, CapButt, JoinMiter);
            break;
    }
}

void PlotSession::draw_marker(const PlotStyle& style, int x, int y) {
    const int r = line_thickness_ + 2;

    switch (style.marker) {
        case Marker::POINT: {
            int p = std::max(1, line_thickness_);
            XFillArc(dpy_, pixmap_, gc_, x - p, y - p, 2 * p, 2 * p, 0, 360 * 64);
            break;
        }
        case Marker::CIRCLE:
            XFillArc(dpy_, pixmap_, gc_, x - r, y - r, 2 * r, 2 * r, 0, 360 * 64);
            break;
        case Marker::SQUARE:
            XFillRectangle(dpy_, pixmap_, gc_, x - r, y - r, 2 * r, 2 * r);
            break;
        case Marker::PLUS:
            XDrawLine(dpy_, pixmap_, gc_, x - r, y, x + r, y);
            XDrawLine(dpy_, pixmap_, gc_, x, y - r, x, y + r);
            break;
        case Marker::CROSS:
            XDrawLine(dpy_, pixmap_, gc_, x - r, y - r, x + r, y + r);
            XDrawLine(dpy_, pixmap_, gc_, x - r, y + r, x + r, y - r);
            break;
        case Marker::STAR:
            XDrawLine(dpy_, pixmap_, gc_, x - r, y, x + r, y);
            XDrawLine(dpy_, pixmap_, gc_, x, y - r, x, y + r);
            XDrawLine(dpy_, pixmap_, gc_, x - r, y - r, x + r, y + r);
            XDrawLine(dpy_, pixmap_, gc_, x - r, y + r, x + r, y - r);
            break;
        case Marker::NONE:
            break;
    }
}

void PlotSession::draw_title(const std::string& title, bool waiting) {
    if (title.empty()) return;
    const int title_h = std::max(MIN_TITLE_HEIGHT, static_cast<int>(height_ * TOP_MARGIN));
    XSetForeground(dpy_, gc_, waiting ? COLOR_WAITING : COLOR_FG);
    int x = width_ / 2 - text_width(title) / 2;
    XDrawString(dpy_, background_, gc_, x, title_h / 2 + 4, title.c_str(), static_cast<int>(title.size()));
}

void PlotSession::draw_row_chrome(const AxisRow& row, const PixelRect& r) {
    char label[32];

    if (row.has_grid()) {
        for (double tick : row.ticks()) {
            if (tick < row.ylim().first || tick > row.ylim().second) continue;
            int y = row_y(row, r, tick);
            XSetForeground(dpy_, gc_, COLOR_GRID);
            XDrawLine(dpy_, background_, gc_, r.x, y, r.x + r.width, y);

            std::snprintf(label, sizeof(label), "%g", tick);
            XSetForeground(dpy_, gc_, COLOR_FG);
            XDrawLine(dpy_, background_, gc_, r.x - 5, y, r.x, y);
            XDrawString(dpy_, background_, gc_, r.x - text_width(label) - 8, y + 4, label,
                        static_cast<int>(std::strlen(label)));
        }
    } else {
        XSetForeground(dpy_, gc_, COLOR_FG);
        for (double v : {row.ylim().first, row.ylim().second}) {
            int y = row_y(row, r, v);
            std::snprintf(label, sizeof(label), "%g", v);
            XDrawString(dpy_, background_, gc_, r.x - text_width(label) - 8, y + 4, label,
                        static_cast<int>(std::strlen(label)));
        }
    }

    XSetForeground(dpy_, gc_, COLOR_FG);
    XDrawRectangle(dpy_, background_, gc_, r.x, r.y, r.width, r.height);

    if (!row.label().empty()) {
        XDrawString(dpy_, background_, gc_, r.x, r.y - 5, row.label().c_str(),
                    static_cast<int>(row.label().size()));
    }

    if (row.has_legend()) {
        int lx = r.x + 8;
        int ly = r.y + 8;
        for (const auto& s : row.series()) {
            if (s.label.empty()) continue;
            XSetForeground(dpy_, gc_, display_color(s.style.color));
            XFillRectangle(dpy_, background_, gc_, lx, ly, LEGEND_BOX, LEGEND_BOX);
            XSetForeground(dpy_, gc_, COLOR_FG);
            XDrawString(dpy_, background_, gc_, lx + LEGEND_BOX + 4, ly + LEGEND_BOX, s.label.c_str(),
                        static_cast<int>(s.label.size()));
            lx += LEGEND_BOX + 4 + text_width(s.label) + 16;
        }
    }
}

void PlotSession::draw_phase_chrome(const PhasePanel& phase, const PixelRect& r) {
    const auto& xl = phase.xlim();
    const auto& yl = phase.ylim();

    XSetForeground(dpy_, gc_, COLOR_GRID);
    if (xl.first < 0.0 && xl.second > 0.0) {
        int x = value_to_pixel(0.0, xl.first, xl.second, r.x, r.width, false);
        XDrawLine(dpy_, background_, gc_, x, r.y, x, r.y + r.height);
    }
    if (yl.first < 0.0 && yl.second > 0.0) {
        int y = value_to_pixel(0.0, yl.first, yl.second, r.y, r.height, true);
        XDrawLine(dpy_, background_, gc_, r.x, y, r.x + r.width, y);
    }

    XSetForeground(dpy_, gc_, COLOR_FG);
    XDrawRectangle(dpy_, background_, gc_, r.x, r.y, r.width, r.height);

    char label[32];
    std::snprintf(label, sizeof(label), "%g", xl.first);
    XDrawString(dpy_, background_, gc_, r.x, r.y + r.height + 14, label, static_cast<int>(std::strlen(label)));
    std::snprintf(label, sizeof(label), "%g", xl.second);
    XDrawString(dpy_, background_, gc_, r.x + r.width - text_width(label), r.y + r.height + 14, label,
                static_cast<int>(std::strlen(label)));
    std::snprintf(label, sizeof(label), "%g", yl.first);
    XDrawString(dpy_, background_, gc_, r.x - text_width(label) - 6, r.y + r.height, label,
                static_cast<int>(std::strlen(label)));
    std::snprintf(label, sizeof(label), "%g", yl.second);
    XDrawString(dpy_, background_, gc_, r.x - text_width(label) - 6, r.y + 10, label,
                static_cast<int>(std::strlen(label)));
}

void PlotSession::render_background(const PlotEngine& engine) {
    XSetForeground(dpy_, gc_, COLOR_BG);
    XFillRectangle(dpy_, background_, gc_, 0, 0, width_, height_);

    for (std::size_t i = 0; i < engine.row_count() && i < row_rects_.size(); ++i) {
        draw_row_chrome(engine.rows()[i], row_rects_[i]);
    }
    if (const PhasePanel* phase = engine.phase_panel()) {
        draw_phase_chrome(*phase, phase_rect_);
    }
    draw_title(engine.title(), engine.waiting());

    background_dirty_ = false;
}

void PlotSession::draw_series(const AxisRow& row, std::size_t series, const PixelRect& r) {
    const SeriesBinding& binding = row.series()[series];
    const std::vector<double> data = binding.buffer.contents();
    const std::size_t n = data.size();

    set_clip(r);
    XSetForeground(dpy_, gc_, display_color(binding.style.color));

    if (binding.style.draws_line()) {
        apply_line_style(binding.style);

        // Non-finite samples break the polyline
        std::vector<XPoint> run;
        auto flush = [&]() {
            if (run.size() >= 2) {
                XDrawLines(dpy_, pixmap_, gc_, run.data(), static_cast<int>(run.size()), CoordModeOrigin);
            }
            run.clear();
        };
        for (std::size_t i = 0; i < n; ++i) {
            if (!std::isfinite(data[i])) {
                flush();
                continue;
            }
            XPoint p;
            p.x = static_cast<short>(sample_x(r, i, n));
            p.y = static_cast<short>(row_y(row, r, data[i]));
            run.push_back(p);
        }
        flush();
        XSetLineAttributes(dpy_, gc_, 1, LineSolid, CapButt, JoinMiter);
    }

    if (binding.style.draws_markers()) {
        for (std::size_t i = 0; i < n; ++i) {
            if (!std::isfinite(data[i])) continue;
            draw_marker(binding.style, sample_x(r, i, n), row_y(row, r, data[i]));
        }
    }

    clear_clip();
}

void PlotSession::draw_baseline(const AxisRow& row, const PixelRect& r) {
    if (!std::isfinite(row.baseline_value())) return;
    set_clip(r);
    XSetForeground(dpy_, gc_, COLOR_BASELINE);
    XSetLineAttributes(dpy_, gc_, line_thickness_, LineSolid, CapButt, JoinMiter);
    int y = row_y(row, r, row.baseline_value());
    XDrawLine(dpy_, pixmap_, gc_, r.x, y, r.x + r.width, y);
    XSetLineAttributes(dpy_, gc_, 1, LineSolid, CapButt, JoinMiter);
    clear_clip();
}

void PlotSession::draw_readout(const AxisRow& row, const PixelRect& r) {
    const std::string& text = row.readout();
    if (text.empty()) return;
    XSetForeground(dpy_, gc_, COLOR_FG);
    XDrawString(dpy_, pixmap_, gc_, r.x + r.width - text_width(text) - 6, r.y + 16, text.c_str(),
                static_cast<int>(text.size()));
}

void PlotSession::draw_phase_points(const PhasePanel& phase, const PixelRect& r) {
    const auto& xl = phase.xlim();
    const auto& yl = phase.ylim();

    set_clip(r);
    XSetForeground(dpy_, gc_, display_color(phase.style().color));
    for (const auto& [x, y] : phase.points()) {
        if (!std::isfinite(x) || !std::isfinite(y)) continue;
        draw_marker(phase.style(),
                    value_to_pixel(x, xl.first, xl.second, r.x, r.width, false),
                    value_to_pixel(y, yl.first, yl.second, r.y, r.height, true));
    }
    clear_clip();
}

void PlotSession::render_frame(const PlotEngine& engine, const FrameUpdate& frame) {
    bool title_changed = std::any_of(frame.drawables.begin(), frame.drawables.end(),
                                     [](const Drawable& d) { return d.kind == DrawableKind::TITLE; });
    if (background_dirty_ || title_changed) {
        render_background(engine);
    }

    XCopyArea(dpy_, background_, pixmap_, gc_, 0, 0, width_, height_, 0, 0);

    // A gap in the data keeps the last lines up; only the title changes
    std::vector<Drawable> drawables;
    if (frame.waiting && engine.frame_count() > 0) {
        drawables = engine.content_drawables();
    }
    drawables.insert(drawables.end(), frame.drawables.begin(), frame.drawables.end());

    for (const Drawable& d : drawables) {
        switch (d.kind) {
            case DrawableKind::PHASE_SCATTER:
                if (engine.phase_panel()) draw_phase_points(*engine.phase_panel(), phase_rect_);
                break;
            case DrawableKind::LINE:
                draw_series(engine.row(d.row), static_cast<std::size_t>(d.series), row_rects_[d.row]);
                break;
            case DrawableKind::BASELINE:
                draw_baseline(engine.row(d.row), row_rects_[d.row]);
                break;
            case DrawableKind::READOUT:
                draw_readout(engine.row(d.row), row_rects_[d.row]);
                break;
            case DrawableKind::TITLE:
                break;
        }
    }

    have_frame_ = true;
}

void PlotSession::present(const PlotEngine& engine, const FrameUpdate& frame) {
    if (background_dirty_) layout(engine);
    if (!frame.drawables.empty()) {
        render_frame(engine, frame);
    }

    if (have_frame_) {
        XCopyArea(dpy_, pixmap_, win_, gc_, 0, 0, width_, height_, 0, 0);
    }
    XFlush(dpy_);

    if (save_requested_) {
        save_requested_ = false;
        save_pixmap_to_ppm("stripplot_out.ppm");
    }
}

void PlotSession::run(PlotEngine& engine, std::mutex& engine_mutex) {
    if (window_title_.empty()) window_title_ = engine.config().window_name;

    init_x11();

    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::milliseconds(engine.config().interval_msec);
    auto next = Clock::now();

    // Engine and accessor errors propagate; drawing errors end the loop
    try {
        while (true) {
            handle_events();
            if (!engine.is_open()) break;

            // The accessor runs without the engine lock: it may wait on a
            // thread that holds something a baseline call also needs.
            std::optional<ValueFrame> values = engine.pull();

            bool presented = true;
            {
                std::lock_guard<std::mutex> lock(engine_mutex);
                FrameUpdate frame = engine.apply(std::move(values));
                presented = render_guarded("PlotSession", [&]() { present(engine, frame); });
            }
            if (!presented) {
                request_close();
                break;
            }

            next += interval;
            auto now = Clock::now();
            if (next < now) next = now;
            std::this_thread::sleep_until(next);
        }
    } catch (...) {
        teardown();
        throw;
    }

    teardown();
}

void PlotSession::save_pixmap_to_ppm(const char* filename) {
    XImage* image = XGetImage(dpy_, pixmap_, 0, 0, width_, height_, AllPlanes, ZPixmap);
    if (!image) {
        std::cerr << "PlotSession: XGetImage failed, nothing saved" << std::endl;
        return;
    }

    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs) {
        std::cerr << "PlotSession: cannot write " << filename << std::endl;
        XDestroyImage(image);
        return;
    }

    ofs << "P6\n" << width_ << " " << height_ << "\n255\n";
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            unsigned long p = XGetPixel(image, x, y);
            ofs.put(static_cast<char>((p >> 16) & 0xFF));
            ofs.put(static_cast<char>((p >> 8) & 0xFF));
            ofs.put(static_cast<char>(p & 0xFF));
        }
    }
    XDestroyImage(image);
    std::cout << "Saved image to " << filename << std::endl;
}

}  // namespace stripplot
