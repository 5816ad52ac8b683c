// plot_style.h
#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stripplot {

enum class LineStyle { NONE, SOLID, DASHED, DASH_DOT, DOTTED };
enum class Marker { NONE, POINT, CIRCLE, SQUARE, PLUS, CROSS, STAR };

struct PlotStyle {
    unsigned long color = 0x1F77B4;
    LineStyle line = LineStyle::SOLID;
    Marker marker = Marker::NONE;
    std::string spec = "b-";

    bool draws_line() const { return line != LineStyle::NONE; }
    bool draws_markers() const { return marker != Marker::NONE; }
};

// Parses a compact format string such as "b-", "r--", "g.", "o" or "k".
// Throws std::invalid_argument on characters it does not understand.
PlotStyle parse_style(const std::string& spec);

unsigned long color_for_letter(char c);

// Per-row style: one series, or several series overlaid on the same axis.
class RowStyle {
public:
    RowStyle(const char* spec) : value_(std::string(spec)) {}
    RowStyle(std::string spec) : value_(std::move(spec)) {}
    RowStyle(std::vector<std::string> overlay) : value_(std::move(overlay)) {}

    static RowStyle single(std::string spec) { return RowStyle(std::move(spec)); }
    static RowStyle overlay(std::vector<std::string> specs) { return RowStyle(std::move(specs)); }

    bool is_overlay() const { return std::holds_alternative<std::vector<std::string>>(value_); }

    // One resolved style per bound series, in drawing order.
    std::vector<PlotStyle> resolve() const;

private:
    std::variant<std::string, std::vector<std::string>> value_;
};

}  // namespace stripplot
