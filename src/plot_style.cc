// plot_style.cc
#include "plot_style.h"
#include <stdexcept>

namespace stripplot {

unsigned long color_for_letter(char c) {
    switch (c) {
        case 'b': return 0x1F77B4;
        case 'g': return 0x2CA02C;
        case 'r': return 0xD62728;
        case 'c': return 0x17BECF;
        case 'm': return 0xE377C2;
        case 'y': return 0xBCBD22;
        case 'k': return 0x000000;
        case 'w': return 0xFFFFFF;
        default:
            throw std::invalid_argument(std::string("Unknown color letter '") + c + "'");
    }
}

PlotStyle parse_style(const std::string& spec) {
    PlotStyle style;
    style.spec = spec;
    style.line = LineStyle::NONE;

    bool have_color = false;
    bool have_line = false;

    for (std::size_t i = 0; i < spec.size(); ++i) {
        char c = spec[i];
        switch (c) {
            case '-':
                if (have_line) throw std::invalid_argument("Duplicate line style in '" + spec + "'");
                have_line = true;
                if (i + 1 < spec.size() && spec[i + 1] == '-') {
                    style.line = LineStyle::DASHED;
                    ++i;
                } else if (i + 1 < spec.size() && spec[i + 1] == '.') {
                    style.line = LineStyle::DASH_DOT;
                    ++i;
                } else {
                    style.line = LineStyle::SOLID;
                }
                break;
            case ':':
                if (have_line) throw std::invalid_argument("Duplicate line style in '" + spec + "'");
                have_line = true;
                style.line = LineStyle::DOTTED;
                break;
            case '.': style.marker = Marker::POINT; break;
            case 'o': style.marker = Marker::CIRCLE; break;
            case 's': style.marker = Marker::SQUARE; break;
            case '+': style.marker = Marker::PLUS; break;
            case 'x': style.marker = Marker::CROSS; break;
            case '*': style.marker = Marker::STAR; break;
            case ' ': break;
            default:
                if (have_color) throw std::invalid_argument("Unsupported style '" + spec + "'");
                try {
                    style.color = color_for_letter(c);
                } catch (const std::invalid_argument&) {
                    throw std::invalid_argument("Unsupported style '" + spec + "'");
                }
                have_color = true;
                break;
        }
    }

    // A bare color (or an empty spec) is a solid line
    if (!have_line && style.marker == Marker::NONE) {
        style.line = LineStyle::SOLID;
    }

    return style;
}

std::vector<PlotStyle> RowStyle::resolve() const {
    std::vector<PlotStyle> out;
    if (const auto* spec = std::get_if<std::string>(&value_)) {
        out.push_back(parse_style(*spec));
        return out;
    }
    const auto& specs = std::get<std::vector<std::string>>(value_);
    if (specs.empty()) {
        throw std::invalid_argument("Overlay style needs at least one series");
    }
    for (const auto& s : specs) {
        out.push_back(parse_style(s));
    }
    return out;
}

}  // namespace stripplot
