#pragma once
#include <cstdint>
#include <deque>
#include <string>

#include "Options.hpp"

namespace Tickbar {

// snapshot returned by ProgressBar::state()
struct State {
    double current_percent = 0; // fraction, 0..1
    double current_bytes = 0;
    double seconds_since = 0;
    double seconds_left = 0;
    double kbs_per_second = 0;
};

// mutable tracking state, owned by ProgressBar and guarded by its mutex
struct TrackState {
    static constexpr size_t MAX_RATE_SAMPLES = 10;

    explicit TrackState(Clock::time_point now)
        : start_time(now), last_shown(now), counter_time(now) {}

    int64_t current_num = 0;
    int current_percent = 0;
    int last_percent = 0;
    int64_t current_saucer_size = 0;
    bool is_alt_saucer_head = false;

    Clock::time_point start_time;
    Clock::time_point last_shown;

    // rolling rate window
    Clock::time_point counter_time;
    int64_t counter_num_since_last = 0;
    std::deque<double> counter_last_ten_rates;

    size_t max_line_width = 0;
    double current_bytes = 0;
    bool finished = false;
    bool halted = false;

    std::string rendered;
};

} // namespace Tickbar
