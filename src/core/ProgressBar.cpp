/**
 * @file ProgressBar.cpp
 * @brief Progress tracker: counters, rolling throughput and redraw decisions.
 *
 * The tracker accumulates counts under a single mutex and hands the state to
 * the Renderer when the visible percentage changes, or on every update when
 * the iteration count is displayed.
 */

#include "ProgressBar.hpp"
#include "utils/common.hpp"


namespace Tickbar {

// length of one rolling-rate window
static constexpr std::chrono::milliseconds RATE_WINDOW{500};

// exact floor(cur * scale / max), the product is widened so counters near INT64_MAX do not overflow
static int64_t scale_to(int64_t cur, int64_t max, int64_t scale){
    return static_cast<int64_t>(static_cast<__int128>(cur) * scale / max);
}

ProgressBar::ProgressBar(int64_t max, Options opts)
    : m_cfg(resolve_config(max, std::move(opts))),
      m_renderer(m_cfg),
      m_state(m_cfg.opts.clock())
{
    if( m_cfg.opts.render_blank ){
        render_blank();
    }
}

Options ProgressBar::default_options(const std::string& description){
    Options opts;
    opts.description = description;
    opts.sink = FdSink::stderr_sink();
    opts.show_bytes = true;
    opts.width = 10;
    opts.throttle = std::chrono::milliseconds(65);
    opts.show_count = true;
    opts.on_completion = [](){
        FdSink::stderr_sink()->write("\n");
    };
    opts.spinner_type = 14;
    opts.full_width = true;
    opts.render_blank = true;
    return opts;
}

std::unique_ptr<ProgressBar> ProgressBar::make_default(int64_t max, const std::string& description){
    return std::make_unique<ProgressBar>(max, default_options(description));
}

/**
 * @brief Adds `num` to the counter and redraws if the change is visible.
 *
 * In unknown-length mode the counter wraps around the bar width, while the
 * byte total keeps growing so the throughput stays accurate.
 *
 * @throws InvalidConfiguration If the maximum is not positive.
 * @throws OutOfRange If the counter ends up past the maximum, or a complete
 *         bar receives more progress. The counter is not rolled back.
 * @throws WriteFailure Propagated from the output sink.
 */
void ProgressBar::add64(int64_t num){
    std::lock_guard<std::mutex> lock(m_mtx);

    if( m_state.halted ){
        return;
    }
    if( m_cfg.max <= 0 ){
        throw InvalidConfiguration("max must be greater than 0");
    }

    const bool was_complete = !m_cfg.ignore_length && m_state.current_num >= m_cfg.max;
    if( m_state.current_num < m_cfg.max ){
        if( m_cfg.ignore_length ){
            m_state.current_num = (m_state.current_num + num) % m_cfg.max;
        } else {
            m_state.current_num += num;
        }
    }

    m_state.current_bytes += static_cast<double>(num);

    // rolling rate, one sample per window
    const auto now = m_cfg.opts.clock();
    m_state.counter_num_since_last += num;
    if( now - m_state.counter_time > RATE_WINDOW ){
        const double window = std::chrono::duration<double>(now - m_state.counter_time).count();
        auto& rates = m_state.counter_last_ten_rates;
        rates.push_back(static_cast<double>(m_state.counter_num_since_last) / window);
        if( rates.size() > TrackState::MAX_RATE_SAMPLES ){
            rates.pop_front();
        }
        m_state.counter_time = now;
        m_state.counter_num_since_last = 0;
    }

    m_state.current_saucer_size = scale_to(m_state.current_num, m_cfg.max, m_cfg.opts.width);
    m_state.current_percent = static_cast<int>(scale_to(m_state.current_num, m_cfg.max, 100));

    const bool update_bar = m_state.current_percent != m_state.last_percent && m_state.current_percent > 0;
    m_state.last_percent = m_state.current_percent;

    if( m_state.current_num > m_cfg.max ){
        throw OutOfRange(fmt::format("current number {} exceeds max {}", m_state.current_num, m_cfg.max));
    }
    if( was_complete && num > 0 ){
        throw OutOfRange(fmt::format("progress already complete at {}", m_cfg.max));
    }

    if( update_bar || m_cfg.opts.show_count ){
        m_renderer.render(m_state);
    }
}

void ProgressBar::render_blank(){
    std::lock_guard<std::mutex> lock(m_mtx);

    if( m_state.halted ){
        return;
    }
    if( m_cfg.max <= 0 ){
        throw InvalidConfiguration("max must be greater than 0");
    }
    if( m_state.current_num == 0 ){
        m_state.last_shown = Clock::time_point{};
    }
    m_renderer.render(m_state);
}

void ProgressBar::halt(){
    std::lock_guard<std::mutex> lock(m_mtx);
    if( !m_state.halted ){
        logger->debug("progress halted at {}/{}", m_state.current_num, m_cfg.max);
    }
    m_state.halted = true;
}

std::string ProgressBar::str() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.rendered;
}

bool ProgressBar::is_finished() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.finished;
}

bool ProgressBar::is_halted() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.halted;
}

int64_t ProgressBar::current() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.current_num;
}

int ProgressBar::current_percent() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.current_percent;
}

double ProgressBar::current_bytes() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_state.current_bytes;
}

std::vector<double> ProgressBar::rate_samples() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return { m_state.counter_last_ten_rates.begin(), m_state.counter_last_ten_rates.end() };
}

/**
 * @brief Returns a consistent snapshot of the progress figures.
 *
 * The remaining time is a linear extrapolation of the time spent so far; it
 * stays 0 until the first unit of progress.
 */
State ProgressBar::state() const {
    std::lock_guard<std::mutex> lock(m_mtx);

    State s;
    s.current_percent = m_cfg.max > 0 ? static_cast<double>(m_state.current_num) / m_cfg.max : 0;
    s.current_bytes = m_state.current_bytes;
    s.seconds_since = std::chrono::duration<double>(m_cfg.opts.clock() - m_state.start_time).count();
    if( m_state.current_num > 0 ){
        s.seconds_left = s.seconds_since / m_state.current_num * (m_cfg.max - m_state.current_num);
    }
    if( s.seconds_since > 0 ){
        s.kbs_per_second = m_state.current_bytes / 1024.0 / s.seconds_since;
    }
    return s;
}

} // namespace Tickbar
