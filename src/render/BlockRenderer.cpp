/**
 * @file BlockRenderer.cpp
 * @brief Differential block character bar.
 *
 * Screen layout after a frame:
 *
 *     <label line>\n
 *     ████████▌          07 / 10 [ 60.0% ]
 *     ^whole   ^partial  ^padding (ends with the progress text)
 *
 * The cursor stays at the end of the bar. When only the count moves, the
 * next frame backspaces over padding + partial block and appends the new
 * full blocks, the label and the existing blocks are never rewritten.
 */

#include "BlockRenderer.hpp"

#include <algorithm>
#include <cmath>

const std::array<std::string_view, 9> BLOCK_GLYPHS = {
    " ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█",
};

std::string_view fractional_block(double fraction){
    if( !(fraction >= 0.125) ){
        return BLOCK_GLYPHS[0];
    }
    auto idx = static_cast<size_t>(std::floor(fraction / 0.125));
    return BLOCK_GLYPHS[std::min<size_t>(idx, BLOCK_GLYPHS.size() - 1)];
}

void BlockRenderer::draw(const Layout& layout, const Frame& frame){
    const int usable = m_columns - 4;
    const int progress_len = static_cast<int>(layout.progress_text.size());

    double ideal = layout.ratio * (usable - progress_len - 2);
    if( ideal < 0 ){
        ideal = 0;
    }
    const int whole = static_cast<int>(std::floor(ideal));
    const double fraction = ideal - whole;
    const int padding = std::max(usable - whole, 0);

    std::string out;
    const bool full_redraw = frame.first || frame.new_message;

    if( !frame.first ){
        int backspaces;
        if( frame.new_message ){
            backspaces = m_memory.last_padding_units + m_memory.last_filled_units + 1 + m_columns - 1;
        } else {
            backspaces = m_memory.last_padding_units + 1;
            if( whole < m_memory.last_filled_units ){
                backspaces += m_memory.last_filled_units - whole;
            }
        }
        out.append(std::max(backspaces, 0), '\b');
    }

    if( full_redraw ){
        out += layout.line;
        out += '\n';
    }

    const int kept = full_redraw ? 0 : std::min(whole, m_memory.last_filled_units);
    for( int i = kept; i < whole; i++ ){
        out += BLOCK_GLYPHS.back();
    }
    out += fractional_block(fraction);

    std::string empty(padding, ' ');
    if( layout.progress_text.size() <= empty.size() ){
        empty.replace(empty.size() - layout.progress_text.size(), layout.progress_text.size(), layout.progress_text);
    }
    out += empty;

    m_memory.last_filled_units = whole;
    m_memory.last_padding_units = padding;
    emit(out);
}

void BlockRenderer::erase(bool /*parallel*/){
    int backspaces = m_memory.last_padding_units + m_memory.last_filled_units + 1 + m_columns - 1;
    emit(std::string(std::max(backspaces, 0), '\b'));
}
