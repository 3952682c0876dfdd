/**
 * @file Renderer.cpp
 * @brief Formatting and output of the single-line progress indicator.
 *
 * Line layouts:
 *
 *   known length:    <desc><pct>% |█████     | (cur/total, rate) [elapsed:remaining]
 *   description end: <pct>% |█████     | (cur/total, rate) [elapsed:remaining] <desc>
 *   unknown length:  <spinner> <desc> (cur, rate) [elapsed]
 *
 * Every line starts with a carriage return so it overwrites the previous one.
 */

#include "Renderer.hpp"
#include "Spinners.hpp"
#include "errors.hpp"
#include "utils/common.hpp"
#include "utils/terminal.hpp"
#include <spdlog/fmt/ranges.h> // for fmt::join()

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace Tickbar {

static std::string repeat(const std::string& s, int64_t n){
    std::string result;
    if( n <= 0 ){
        return result;
    }
    result.reserve(s.size() * n);
    for( int64_t i = 0; i < n; i++ ){
        result += s;
    }
    return result;
}

static double seconds_between(Clock::time_point from, Clock::time_point to){
    return std::chrono::duration<double>(to - from).count();
}

/**
 * @brief Renders the bar if the throttle allows it.
 *
 * The final redraw at completion bypasses the throttle. Once the bar is
 * finished nothing more is drawn; the completion callback runs exactly once,
 * right after the final line.
 *
 * @throws WriteFailure Propagated from the sink. A failed clear aborts
 *         before the new line is drawn. A failed final draw still runs the
 *         completion callback before the error propagates.
 */
void Renderer::render(TrackState& st) const {
    const Options& o = m_cfg.opts;
    const auto now = o.clock();

    if( now - st.last_shown < o.throttle && st.current_num < m_cfg.max ){
        return;
    }

    // a finished bar keeps its last line on screen
    if( !st.finished ){
        clear(st);
    }

    if( !st.finished && st.current_num >= m_cfg.max ){
        st.finished = true;
        logger->debug("progress finished: {}/{} after {:.3f}s", st.current_num, m_cfg.max, seconds_between(st.start_time, now));
        if( !o.clear_on_finish ){
            try {
                draw(st, now);
            } catch( const WriteFailure& ){
                // the bar is finished either way, the callback must still run once
                if( o.on_completion ){
                    o.on_completion();
                }
                throw;
            }
        }
        if( o.on_completion ){
            o.on_completion();
        }
    }
    if( st.finished ){
        // in ANSI mode the line was never padded with spaces, erase it explicitly
        if( o.use_ansi_codes && o.clear_on_finish ){
            clear(st);
        }
        return;
    }

    const size_t width = draw(st, now);
    st.max_line_width = std::max(st.max_line_width, width);
    st.last_shown = now;
}

double Renderer::average_rate(const TrackState& st, Clock::time_point now) const {
    const auto& rates = st.counter_last_ten_rates;
    if( !rates.empty() && !st.finished ){
        return std::accumulate(rates.begin(), rates.end(), 0.0) / rates.size();
    }

    const double t = seconds_between(st.start_time, now);
    return t > 0 ? st.current_bytes / t : 0;
}

std::string Renderer::info_segment(const TrackState& st, double rate) const {
    const Options& o = m_cfg.opts;
    std::vector<std::string> parts;

    if( o.show_count ){
        if( !m_cfg.ignore_length ){
            if( o.show_bytes ){
                auto [value, suffix] = humanize_bytes(st.current_bytes);
                if( suffix == m_cfg.max_humanized_suffix ){
                    parts.push_back(fmt::format("{}/{}{}", value, m_cfg.max_humanized, m_cfg.max_humanized_suffix));
                } else {
                    parts.push_back(fmt::format("{}{}/{}{}", value, suffix, m_cfg.max_humanized, m_cfg.max_humanized_suffix));
                }
            } else {
                parts.push_back(fmt::format("{:.0f}/{}", st.current_bytes, m_cfg.max));
            }
        } else {
            if( o.show_bytes ){
                parts.push_back(bytes2human(st.current_bytes));
            } else {
                parts.push_back(fmt::format("{:.0f}/-", st.current_bytes));
            }
        }
    }

    if( o.show_bytes && rate > 0 && std::isfinite(rate) ){
        parts.push_back(bytes2human(rate) + "/s");
    }

    if( parts.empty() ){
        return "";
    }
    return fmt::format("({})", fmt::join(parts, ", "));
}

size_t Renderer::text_width(const std::string& str) const {
    std::string clean = m_cfg.opts.color_codes ? colorize(str) : str;
    clean.erase(std::remove(clean.begin(), clean.end(), '\r'), clean.end());
    return display_width(strip_ansi(clean));
}

/**
 * @brief Derives the fill-track width that makes the line span the terminal.
 */
int Renderer::resolve_width(const std::string& left, const std::string& right, const std::string& info) const {
    const Options& o = m_cfg.opts;

    int columns = 0;
    auto term = o.term_width();
    if( term && *term > 0 ){
        columns = *term;
    } else {
        logger->debug("terminal width unavailable, assuming 80 columns");
        columns = 80;
    }

    int amend = 1; // trailing space
    if( !left.empty() ){
        amend = 4; // " [" + ":" + "]" or " [" + "] "
    } else if( !right.empty() ){
        amend = 3;
    }
    if( o.description_at_end ){
        amend += 1;
    }

    return columns
        - static_cast<int>(text_width(o.description))
        - 10 // percentage, bar ends and separators
        - amend
        - static_cast<int>(display_width(info))
        - static_cast<int>(left.size())
        - static_cast<int>(right.size());
}

std::string Renderer::build_line(TrackState& st, Clock::time_point now) const {
    const Options& o = m_cfg.opts;
    const Theme& th = o.theme;

    const double rate = average_rate(st, now);
    const std::string info = info_segment(st, rate);
    const int64_t elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - st.start_time).count();

    std::string left, right;
    if( o.predict_time ){
        const double remaining = (1 / rate) * static_cast<double>(m_cfg.max - st.current_num);
        if( !std::isfinite(remaining) || remaining >= static_cast<double>(std::numeric_limits<int64_t>::max()) ){
            right = "?";
        } else {
            right = seconds2human(std::max<int64_t>(0, static_cast<int64_t>(remaining)));
        }
    }
    if( o.predict_time || o.elapsed_time ){
        left = seconds2human(elapsed);
    }

    int64_t width = o.width;
    if( o.full_width && !m_cfg.ignore_length ){
        width = resolve_width(left, right, info);
        st.current_saucer_size = st.current_percent * width / 100;
    }

    std::string saucer, head;
    if( st.current_saucer_size > 0 ){
        saucer = repeat(m_cfg.ignore_length ? th.saucer_padding : th.saucer, st.current_saucer_size - 1);

        if( st.current_saucer_size == width || th.saucer_head.empty() ){
            head = th.saucer;
        } else if( !th.alt_saucer_head.empty() && st.is_alt_saucer_head ){
            head = th.alt_saucer_head;
            st.is_alt_saucer_head = false;
        } else {
            head = th.saucer_head;
            st.is_alt_saucer_head = true;
        }
    }

    std::string line;
    if( m_cfg.ignore_length ){
        const auto& frames = spinner_frames(o.spinner_type);
        const int64_t millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - st.start_time).count();
        const std::string_view spinner = frames[(millis / 100) % frames.size()];

        if( o.elapsed_time ){
            if( o.description_at_end ){
                line = fmt::format("\r{} {} [{}] {} ", spinner, info, left, o.description);
            } else {
                line = fmt::format("\r{} {} {} [{}] ", spinner, o.description, info, left);
            }
        } else {
            if( o.description_at_end ){
                line = fmt::format("\r{} {} {} ", spinner, info, o.description);
            } else {
                line = fmt::format("\r{} {} {} ", spinner, o.description, info);
            }
        }
    } else {
        const std::string bar = fmt::format("{:4d}% {}{}{}{}{} {}",
            st.current_percent,
            th.bar_start,
            saucer,
            head,
            repeat(th.saucer_padding, width - st.current_saucer_size),
            th.bar_end,
            info);

        // no time estimate on a complete bar
        std::string times;
        if( st.current_percent != 100 ){
            if( !right.empty() ){
                times = fmt::format(" [{}:{}]", left, right);
            } else if( !left.empty() ){
                times = fmt::format(" [{}]", left);
            }
        }

        if( !right.empty() ){
            if( o.description_at_end ){
                line = fmt::format("\r{}{} {}", bar, times, o.description);
            } else {
                line = fmt::format("\r{}{}{}", o.description, bar, times);
            }
        } else {
            if( o.description_at_end ){
                line = fmt::format("\r{}{} {} ", bar, times, o.description);
            } else {
                line = fmt::format("\r{}{}{} ", o.description, bar, times);
            }
        }
    }

    if( o.color_codes ){
        line = colorize(line);
    }
    return line;
}

size_t Renderer::draw(TrackState& st, Clock::time_point now) const {
    std::string line = build_line(st, now);
    st.rendered = line;
    write(line);
    return text_width(line);
}

/**
 * @brief Wipes the previously drawn line and returns the cursor to column 0.
 *
 * Nothing was drawn yet if the recorded width is zero.
 */
void Renderer::clear(const TrackState& st) const {
    if( st.max_line_width == 0 ){
        return;
    }
    if( m_cfg.opts.use_ansi_codes ){
        write(ANSI_CLEAR_LINE "\r");
        return;
    }
    write("\r" + std::string(st.max_line_width, ' ') + "\r");
}

void Renderer::write(const std::string& str) const {
    m_cfg.opts.sink->write(str);
    m_cfg.opts.sink->sync();
}

} // namespace Tickbar
