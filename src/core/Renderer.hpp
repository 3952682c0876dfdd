#pragma once
#include <string>

#include "Options.hpp"
#include "State.hpp"

namespace Tickbar {

// Formats and writes the progress line. Not thread-safe: every call must be
// made with the owning ProgressBar's lock held.
class Renderer {
    public:
    explicit Renderer(const Config& cfg) : m_cfg(cfg) {}

    // throttles, clears the previous line, handles the finish transition and draws
    void render(TrackState& st) const;

    // the line for the current state, starting with '\r'; advances the head animation
    std::string build_line(TrackState& st, Clock::time_point now) const;

    // "(count, rate)" cluster, empty if neither is shown
    std::string info_segment(const TrackState& st, double rate) const;

    // mean of the rate window, or the overall rate when there is no window yet or the bar is finished
    double average_rate(const TrackState& st, Clock::time_point now) const;

    // columns the text takes on screen, markup and escapes excluded
    size_t text_width(const std::string& str) const;

    private:
    size_t draw(TrackState& st, Clock::time_point now) const;
    void clear(const TrackState& st) const;
    void write(const std::string& str) const;
    int resolve_width(const std::string& left, const std::string& right, const std::string& info) const;

    const Config& m_cfg;
};

} // namespace Tickbar
