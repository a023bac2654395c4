#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// What the bar shows. Only ProgressBar mutates it, renderers read it.
struct ProgressState {
    uint64_t total = 1;     // 0 or 1 selects ratio mode
    double current = 0;     // always within [0, total], [0, 1] in ratio mode
    bool saturated = false; // the last value asked for was beyond total
    std::string message;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    bool first_update = true;

    bool ratio_mode() const { return total <= 1; }

    // clamps and stores a new progress value
    void set_current(double n);
};
