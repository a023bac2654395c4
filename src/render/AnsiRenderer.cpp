/**
 * @file AnsiRenderer.cpp
 * @brief Color sweep bar for interactive terminals.
 *
 * Every frame overwrites the whole line: "\b\r" returns to column 0 (the
 * backspace first steps off the trailing space of the previous frame), the
 * filled part of the text gets a blue background, the rest the default one.
 * In parallel mode the reporter always starts one line below the bar, so the
 * frame moves the cursor up instead and ends with a newline.
 */

#include "AnsiRenderer.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cmath>

rgb_t hsv2rgb(double h, double s, double v){
    h = h - std::floor(h);
    const double h6 = h * 6;
    const int sector = static_cast<int>(std::floor(h6)) % 6;
    const double f = h6 - std::floor(h6);
    const double p = v * (1 - s);
    const double q = v * (1 - s * f);
    const double t = v * (1 - s * (1 - f));

    double r, g, b;
    switch( sector ){
        case 0:  r = v; g = t; b = p; break;
        case 1:  r = q; g = v; b = p; break;
        case 2:  r = p; g = v; b = t; break;
        case 3:  r = p; g = q; b = v; break;
        case 4:  r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }

    auto channel = [](double x) -> uint8_t {
        return static_cast<uint8_t>(std::clamp(std::lround(256 * x), 0L, 255L));
    };
    return { channel(r), channel(g), channel(b) };
}

std::vector<rgb_t> make_gradient(int columns, double hue, double saturation){
    std::vector<rgb_t> gradient;
    gradient.reserve(std::max(columns, 0));
    for( int i = 1; i <= columns; i++ ){
        double wave = 0.5 * (1 + std::sin(i / 8.0));
        double value = wave * 0.3 + 0.65;
        gradient.push_back(hsv2rgb(hue, saturation, value));
    }
    return gradient;
}

AnsiRenderer::AnsiRenderer(FILE* out, const TerminalProfile& profile, const BarOptions& options)
    : Renderer(out), m_columns(profile.columns), m_true_color(options.true_color)
{
    if( m_true_color ){
        m_gradient = make_gradient(m_columns, options.gradient_hue, options.gradient_saturation);
    }
}

std::string AnsiRenderer::colorize(const std::string& filled) const {
    std::string result;
    result.reserve(filled.size() * 20);
    // one color per code point, an escape never lands inside a multibyte character
    size_t column = 0;
    for( size_t pos = 0; pos < filled.size(); column++ ){
        size_t end = pos + 1;
        while( end < filled.size() && (static_cast<unsigned char>(filled[end]) & 0xc0) == 0x80 ){
            end++;
        }
        const rgb_t& c = m_gradient[std::min(column, m_gradient.size() - 1)];
        result += fmt::format("\x1b[48;2;{};{};{}m", c[0], c[1], c[2]);
        result.append(filled, pos, end - pos);
        pos = end;
    }
    return result;
}

void AnsiRenderer::draw(const Layout& layout, const Frame& frame){
    std::string filled = layout.line.substr(0, layout.split_index);
    std::string unfilled = layout.line.substr(layout.split_index);
    if( m_true_color && !m_gradient.empty() ){
        filled = colorize(filled);
    }

    std::string out;
    if( frame.parallel ){
        out = fmt::format(ANSI_CURSOR_UP ANSI_BAR_FILLED " {}" ANSI_BAR_EMPTY "{}" ANSI_COLOR_RESET " \n", filled, unfilled);
    } else {
        if( frame.first ){
            out = " "; // the \b below must not eat what the caller printed before us
        }
        if( m_true_color ){
            out += fmt::format("\b\r{}" ANSI_BAR_EMPTY "{}" ANSI_COLOR_RESET " ", filled, unfilled);
        } else {
            out += fmt::format("\b\r" ANSI_BAR_FILLED " {}" ANSI_BAR_EMPTY "{}" ANSI_COLOR_RESET " ", filled, unfilled);
        }
    }
    emit(out);
}

void AnsiRenderer::erase(bool parallel){
    const std::string blank(std::max(m_columns - 1, 0), ' ');
    if( parallel ){
        emit(ANSI_CURSOR_UP + blank + ANSI_COLOR_RESET "\r");
    } else {
        emit("\b\r" + blank + ANSI_COLOR_RESET "\r");
    }
}
