/**
 * @file units.cpp
 * @brief Human readable durations for bar summaries and log lines.
 */

#include "units.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

/**
 * @brief Converts seconds to a compact duration string.
 *
 * Emits up to maxUnits consecutive units out of days, hours, minutes and
 * seconds, starting at the largest non-zero one ("2d5h", "3h15m", "45s").
 *
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of units to display.
 * @return Duration string, "0s" for zero.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    static constexpr std::array<std::pair<uint64_t, char>, 4> units {{
        {86400, 'd'}, {3600, 'h'}, {60, 'm'}, {1, 's'}
    }};

    std::string result;
    size_t used = 0;

    for( const auto& [size, suffix] : units ){
        if( used == maxUnits ){
            break;
        }
        uint64_t amount = seconds / size;
        if( amount == 0 && used == 0 ){
            continue;
        }
        seconds %= size;
        result += std::to_string(amount);
        result += suffix;
        used++;
    }

    return result.empty() ? "0s" : result;
}

/**
 * @brief Formats a steady clock interval.
 *
 * Intervals under a minute keep one decimal of seconds ("3.4s"), longer ones
 * go through seconds2human().
 */
std::string elapsed2human(std::chrono::steady_clock::duration elapsed, size_t maxUnits) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if( ms < 0 ){
        ms = 0;
    }
    if( ms < 60000 ){
        return fmt::format("{:.1f}s", ms / 1000.0);
    }
    return seconds2human(static_cast<uint64_t>(ms / 1000), maxUnits);
}
