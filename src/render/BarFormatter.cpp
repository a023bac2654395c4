/**
 * @file BarFormatter.cpp
 * @brief Text layout of a progress bar frame.
 *
 * Two display modes:
 *  - ratio mode (total <= 1): current is a fraction, only a percentage is shown;
 *  - count mode (total > 1): "current / total [ pct ]". The ratio is
 *    (current-1)/total, i.e. update(k) reports the state before item k is done,
 *    so update(1) shows 0% and update(total) shows (total-1)/total.
 */

#include "BarFormatter.hpp"
#include "utils/utf8.hpp"
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

int BarFormatter::count_width(uint64_t total){
    if( total == 0 ){
        return 1;
    }
    return std::max(1, static_cast<int>(std::ceil(std::log10(static_cast<double>(total)))));
}

std::string BarFormatter::fit_label(const std::string& message, size_t progress_len, int columns){
    if( utf8_length(message) + progress_len + 3 <= static_cast<size_t>(std::max(columns, 0)) ){
        return message;
    }
    long keep = static_cast<long>(columns) - static_cast<long>(progress_len) - 6;
    if( keep < 0 ){
        keep = 0;
    }
    return message.substr(0, utf8_offset(message, static_cast<size_t>(keep))) + "...";
}

std::string BarFormatter::progress_text(const ProgressState& state, double& ratio){
    std::string text;

    // "[ 100.0% ]" is one column wider than the other percentages, the gap absorbs it
    if( state.ratio_mode() ){
        ratio = std::clamp(state.current, 0.0, 1.0);
        text = fmt::format("[ {:4.1f}% ]", ratio * 100);
    } else {
        const int width = count_width(state.total);
        ratio = state.saturated ? 1.0 : (state.current - 1) / static_cast<double>(state.total);
        double percentage = std::clamp(ratio * 100, 0.0, 100.0);
        auto count = static_cast<uint64_t>(std::llround(state.current));
        text = fmt::format("{:0{}d} / {:0{}d} [ {:4.1f}% ]", count, width, state.total, width, percentage);
    }

    // clamped again: count mode ratio is negative for current < 1
    ratio = std::clamp(ratio, 0.0, 1.0);
    return text;
}

Layout BarFormatter::format(const ProgressState& state) const {
    Layout layout;
    layout.total_width = m_profile.columns;
    layout.progress_text = progress_text(state, layout.ratio);
    layout.label_text = fit_label(state.message, layout.progress_text.size(), m_profile.columns);

    const long gap = static_cast<long>(m_profile.columns) - 1
        - static_cast<long>(utf8_length(layout.label_text) + 1)
        - static_cast<long>(layout.progress_text.size());
    layout.gap = static_cast<int>(std::max(gap, 0L));

    layout.line = layout.label_text;
    layout.line.append(layout.gap, ' ');
    if( m_profile.interactive ){
        layout.line += layout.progress_text;
    } else {
        // the block bar carries the numbers, the label line only reserves their width
        layout.line.append(layout.progress_text.size(), ' ');
    }

    const auto fill = static_cast<size_t>(std::ceil(layout.ratio * m_profile.columns));
    layout.split_index = utf8_offset(layout.line, fill);
    return layout;
}
