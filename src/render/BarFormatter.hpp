#pragma once
#include <cstdint>
#include <string>

#include "core/ProgressState.hpp"
#include "core/TerminalProfile.hpp"

// One frame worth of text, recomputed on every update.
struct Layout {
    std::string label_text;     // message, truncated to fit (on a code point boundary)
    std::string progress_text;  // "[ 42.0% ]" or "07 / 10 [ 60.0% ]"
    std::string line;           // label + gap + progress text (or blanks of the same width)
    double ratio = 0;           // fill fraction, [0, 1]
    int gap = 0;                // spaces between label and progress text
    size_t split_index = 0;     // line[0, split_index) is the filled part, a byte offset
    int total_width = 0;        // terminal columns the layout was computed for
};

class BarFormatter {
    public:
    explicit BarFormatter(const TerminalProfile& profile) : m_profile(profile) {}

    Layout format(const ProgressState& state) const;

    // digits used for both numbers in count mode
    static int count_width(uint64_t total);

    // label that leaves room for progress_len columns of progress text
    static std::string fit_label(const std::string& message, size_t progress_len, int columns);

    // progress text and fill ratio for a state
    static std::string progress_text(const ProgressState& state, double& ratio);

    private:
    TerminalProfile m_profile;
};
