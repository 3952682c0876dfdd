#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Options.hpp"
#include "Renderer.hpp"
#include "State.hpp"
#include "errors.hpp"

namespace Tickbar {

/**
 * Thread-safe progress tracker. Every public method takes the same lock, so
 * updates and redraws from several threads are serialized.
 *
 * Pass max = -1 when the total is unknown: the bar then shows a spinner and
 * the counter cycles instead of saturating.
 */
class ProgressBar {
    public:
    explicit ProgressBar(int64_t max, Options opts = {});

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    static Options default_options(const std::string& description = "");

    // stderr, byte display, 65ms throttle, full width, spinner 14, blank 0% line drawn right away
    static std::unique_ptr<ProgressBar> make_default(int64_t max, const std::string& description = "");

    void add(int num) { add64(num); }
    void add64(int64_t num);

    // draws the current state now; a bar that has not moved yet bypasses the throttle
    void render_blank();

    // stops all further updates, including errors
    void halt();

    std::string str() const;
    bool is_finished() const;
    bool is_halted() const;
    int64_t current() const;
    int current_percent() const;
    double current_bytes() const;
    std::vector<double> rate_samples() const;
    State state() const;

    int64_t max() const { return m_cfg.max; }

    private:
    Config m_cfg;
    Renderer m_renderer;
    TrackState m_state;
    mutable std::mutex m_mtx;
};

} // namespace Tickbar
