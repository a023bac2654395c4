#pragma once
#include <array>
#include <string_view>

#include "Renderer.hpp"

// what the previous block frame left on screen
struct RedrawMemory {
    int last_filled_units = 0;   // full blocks
    int last_padding_units = 0;  // cells after the partial block, progress text included
};

// UTF-8 glyphs for 0/8 .. 8/8 of a cell
extern const std::array<std::string_view, 9> BLOCK_GLYPHS;

// glyph for the fractional part of the bar, blank below 1/8
std::string_view fractional_block(double fraction);

// Label line plus a bar of Unicode blocks, for consumers that do not render
// colors. Later frames backspace over just the part that changes.
class BlockRenderer : public Renderer {
    public:
    BlockRenderer(FILE* out, const TerminalProfile& profile) : Renderer(out), m_columns(profile.columns) {}

    void draw(const Layout& layout, const Frame& frame) override;
    void erase(bool parallel) override;

    const RedrawMemory& memory() const { return m_memory; }

    private:
    int m_columns;
    RedrawMemory m_memory;
};
