/**
 * @file units.cpp
 * @brief Implementation of unit conversion utilities.
 *
 * Converts byte counts and rates into short binary-multiple strings
 * ("5 B", "1.5 KB", "10 MB") and whole seconds into compact durations
 * ("45s", "3m0s", "1h2m3s").
 */

#include "units.hpp"

#include <cmath>
#include <vector>
#include <spdlog/fmt/fmt.h>

/**
 * @brief Converts a byte count to a humanized value and its unit suffix.
 *
 * Values below 10 are printed as plain bytes without decimals. Larger values
 * are scaled by the largest power of 1024 not exceeding them and rounded to
 * one decimal; the decimal is kept only while the scaled value is below 10.
 *
 * @param size Size in bytes (or bytes per second).
 * @return Pair of formatted value and suffix, e.g. {"1.5", " KB"}.
 */
std::pair<std::string, std::string> humanize_bytes(double size){
    static const std::vector<std::string> units { " B", " KB", " MB", " GB", " TB", " PB", " EB" };
    constexpr double BASE = 1024.0;

    if( size < 10 ){
        return { fmt::format("{:.0f}", size), units[0] };
    }

    size_t i = 0;
    double scale = 1.0;
    while( i < units.size()-1 && size >= scale * BASE ){
        scale *= BASE;
        i++;
    }

    const double val = std::floor(size / scale * 10 + 0.5) / 10;
    if( val < 10 ){
        return { fmt::format("{:.1f}", val), units[i] };
    }
    return { fmt::format("{:.0f}", val), units[i] };
}

std::string bytes2human(double size){
    auto [value, suffix] = humanize_bytes(size);
    return value + suffix;
}

/**
 * @brief Converts seconds to a compact duration string.
 *
 * Once a larger unit has been emitted every smaller unit follows, even when
 * zero ("2h0m5s"). Zero seconds yield "0s".
 *
 * @param seconds Duration in seconds, expected non-negative.
 * @return Human-readable duration string.
 */
std::string seconds2human(int64_t seconds) {
    static const std::vector<std::pair<int64_t, char>> units = {
        {3600, 'h'},
        {60, 'm'},
        {1, 's'}
    };

    if( seconds <= 0 ){
        return "0s";
    }

    std::string result;
    for (const auto& [size, suffix] : units) {
        const int64_t amount = seconds / size;
        seconds %= size;
        if (amount > 0 || !result.empty() || size == 1) {
            result += std::to_string(amount);
            result += suffix;
        }
    }
    return result;
}
