#pragma once
#include <array>
#include <cstdint>
#include <vector>

#include "Renderer.hpp"
#include "core/BarOptions.hpp"

using rgb_t = std::array<uint8_t, 3>;

// per-column colors of the true color bar: fixed hue/saturation, sine wave value
std::vector<rgb_t> make_gradient(int columns, double hue, double saturation);
rgb_t hsv2rgb(double h, double s, double v);

// Single line redrawn in place, the filled part is a background color sweep.
class AnsiRenderer : public Renderer {
    public:
    AnsiRenderer(FILE* out, const TerminalProfile& profile, const BarOptions& options);

    void draw(const Layout& layout, const Frame& frame) override;
    void erase(bool parallel) override;

    const std::vector<rgb_t>& gradient() const { return m_gradient; }

    private:
    std::string colorize(const std::string& filled) const;

    int m_columns;
    bool m_true_color;
    std::vector<rgb_t> m_gradient; // empty unless true color
};
