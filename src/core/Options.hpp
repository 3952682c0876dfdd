#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "io/Sink.hpp"

namespace Tickbar {

using Clock = std::chrono::steady_clock;

// glyphs the bar is built from, any of them may carry color markup
struct Theme {
    std::string saucer;          // fill
    std::string alt_saucer_head; // alternates with saucer_head on successive redraws
    std::string saucer_head;     // leading edge of the fill
    std::string saucer_padding;  // unfilled part
    std::string bar_start;
    std::string bar_end;
};

const Theme& default_theme();

struct Options {
    int width = 40;
    Theme theme = default_theme();
    std::string description;
    bool description_at_end = false;

    std::shared_ptr<Sink> sink;  // stdout if not set
    Clock::duration throttle{0}; // minimum time between redraws
    int spinner_type = 9;        // 0..75, used when the length is unknown

    bool elapsed_time = true;
    bool predict_time = true;    // implies elapsed_time
    bool show_bytes = false;     // humanized sizes and rate
    bool show_count = false;     // current/total, forces a redraw on every add
    bool full_width = false;
    bool render_blank = false;   // draw a 0% bar on construction
    bool color_codes = false;
    bool use_ansi_codes = false; // erase with ESC[2K instead of spaces
    bool clear_on_finish = false;

    std::function<void()> on_completion;

    // injectable for tests
    std::function<Clock::time_point()> clock = Clock::now;
    std::function<std::optional<int>()> term_width;

    // applies a named option given as text, throws InvalidConfiguration
    void set(const std::string& name, const std::string& value);
};

// options after construction-time resolution
struct Config {
    Options opts;
    int64_t max = 0;
    bool ignore_length = false;  // max was -1, the bar becomes a spinner
    std::string max_humanized;
    std::string max_humanized_suffix;
};

Config resolve_config(int64_t max, Options opts);

} // namespace Tickbar
