#pragma once

enum class RenderMode {
    Auto,   // ANSI on a terminal, blocks otherwise
    Ansi,
    Block,
};

struct BarOptions {
    RenderMode mode = RenderMode::Auto;

    // 24-bit gradient under the filled part of the ANSI bar
    bool true_color = false;
    double gradient_hue = 0.5;
    double gradient_saturation = 0.6;
};
