#include "test_utils.hpp"
#include "core/ProgressBar.hpp"
#include "core/Renderer.hpp"
#include "utils/terminal.hpp"

#include <limits>

using namespace Tickbar;
using namespace std::chrono_literals;

class RendererTest : public ::testing::Test {
protected:
    // renderer over a resolved config, kept alive by the fixture
    Renderer& make(int64_t max, Options opts) {
        m_cfg = resolve_config(max, std::move(opts));
        m_renderer = std::make_unique<Renderer>(m_cfg);
        return *m_renderer;
    }

    Options opts() { return test_options(m_out, m_clock); }

    std::ostringstream m_out;
    FakeClock m_clock;
    Config m_cfg;
    std::unique_ptr<Renderer> m_renderer;
};

TEST_F(RendererTest, info_segment_empty) {
    Renderer& r = make(10, opts());
    TrackState st(m_clock.now);
    st.current_bytes = 3;
    EXPECT_EQ("", r.info_segment(st, 5));
}

TEST_F(RendererTest, info_segment_count) {
    auto o = opts();
    o.show_count = true;
    Renderer& r = make(10, o);
    TrackState st(m_clock.now);
    st.current_bytes = 3;
    EXPECT_EQ("(3/10)", r.info_segment(st, 5));
}

TEST_F(RendererTest, info_segment_bytes_shared_suffix) {
    auto o = opts();
    o.show_count = true;
    o.show_bytes = true;
    Renderer& r = make(2048, o);
    TrackState st(m_clock.now);
    st.current_bytes = 1024;
    EXPECT_EQ("(1.0/2.0 KB)", r.info_segment(st, 0));
    EXPECT_EQ("(1.0/2.0 KB, 1.0 KB/s)", r.info_segment(st, 1024));
}

TEST_F(RendererTest, info_segment_bytes_different_suffix) {
    auto o = opts();
    o.show_count = true;
    o.show_bytes = true;
    Renderer& r = make(2048, o);
    TrackState st(m_clock.now);
    st.current_bytes = 5;
    EXPECT_EQ("(5 B/2.0 KB)", r.info_segment(st, 0));
}

TEST_F(RendererTest, info_segment_rate_only) {
    auto o = opts();
    o.show_bytes = true;
    Renderer& r = make(2048, o);
    TrackState st(m_clock.now);
    EXPECT_EQ("(1.5 KB/s)", r.info_segment(st, 1536));
    EXPECT_EQ("", r.info_segment(st, std::numeric_limits<double>::infinity()));
    EXPECT_EQ("", r.info_segment(st, 0));
}

TEST_F(RendererTest, info_segment_unknown_length) {
    auto o = opts();
    o.show_count = true;
    Renderer& r = make(-1, o);
    TrackState st(m_clock.now);
    st.current_bytes = 12;
    EXPECT_EQ("(12/-)", r.info_segment(st, 0));
}

TEST_F(RendererTest, info_segment_unknown_length_bytes) {
    auto o = opts();
    o.show_count = true;
    o.show_bytes = true;
    Renderer& r = make(-1, o);
    TrackState st(m_clock.now);
    st.current_bytes = 12;
    EXPECT_EQ("(12 B)", r.info_segment(st, 0));
}

TEST_F(RendererTest, average_rate_window) {
    Renderer& r = make(100, opts());
    TrackState st(m_clock.now);
    st.counter_last_ten_rates = {2, 4};
    st.current_bytes = 50;
    m_clock.advance(10s);
    EXPECT_DOUBLE_EQ(3, r.average_rate(st, m_clock.now));

    st.finished = true;
    EXPECT_DOUBLE_EQ(5, r.average_rate(st, m_clock.now));
}

TEST_F(RendererTest, average_rate_without_samples) {
    Renderer& r = make(100, opts());
    TrackState st(m_clock.now);
    st.current_bytes = 50;
    EXPECT_DOUBLE_EQ(0, r.average_rate(st, m_clock.now));
    m_clock.advance(2s);
    EXPECT_DOUBLE_EQ(25, r.average_rate(st, m_clock.now));
}

TEST_F(RendererTest, text_width_skips_markup) {
    auto o = opts();
    o.color_codes = true;
    Renderer& r = make(10, o);
    EXPECT_EQ(7u, r.text_width("\r[red]abc[reset] █|█"));
    EXPECT_EQ(3u, r.text_width("\x1b[2K\rabc"));
}

TEST_F(RendererTest, build_line_known_length) {
    Renderer& r = make(10, opts());
    TrackState st(m_clock.now);
    st.current_num = 5;
    st.current_percent = 50;
    st.current_saucer_size = 5;
    EXPECT_EQ("\r  50% |█████     |  [0s:?]", r.build_line(st, m_clock.now));
    EXPECT_EQ("", m_out.str());
}

TEST_F(RendererTest, build_line_hides_times_at_100) {
    Renderer& r = make(10, opts());
    TrackState st(m_clock.now);
    st.current_num = 10;
    st.current_percent = 100;
    st.current_saucer_size = 10;
    st.current_bytes = 10;
    st.finished = true;
    EXPECT_EQ("\r 100% |██████████| ", r.build_line(st, m_clock.now + 2s));
}

// rendering through the tracker

TEST_F(RendererTest, line_with_rate_and_times) {
    auto o = opts();
    ProgressBar bar(10, o);
    m_clock.advance(5s);
    bar.add(5);
    EXPECT_EQ("\r  50% |█████     |  [5s:5s]", bar.str());
}

TEST_F(RendererTest, line_with_bytes) {
    auto o = opts();
    o.show_count = true;
    o.show_bytes = true;
    ProgressBar bar(2048, o);
    m_clock.advance(1s);
    bar.add(1024);
    EXPECT_EQ("\r  50% |█████     | (1.0/2.0 KB, 1.0 KB/s) [1s:1s]", bar.str());
}

TEST_F(RendererTest, zero_percent_redrawn_with_count) {
    auto o = opts();
    o.show_count = true;
    o.show_bytes = true;
    ProgressBar bar(2048, o);
    bar.add(5);
    EXPECT_EQ("\r   0% |          | (5 B/2.0 KB) [0s:?]", bar.str());
}

TEST_F(RendererTest, description_at_end_without_prediction) {
    auto o = opts();
    o.predict_time = false;
    o.description = "dl";
    o.description_at_end = true;
    ProgressBar bar(10, o);
    bar.add(3);
    EXPECT_EQ("\r  30% |███       |  [0s] dl ", bar.str());
}

TEST_F(RendererTest, description_in_front) {
    auto o = opts();
    o.description = "dl ";
    ProgressBar bar(10, o);
    bar.add(3);
    EXPECT_EQ("\rdl   30% |███       |  [0s:?]", bar.str());
}

TEST_F(RendererTest, no_times) {
    auto o = opts();
    o.predict_time = false;
    o.elapsed_time = false;
    ProgressBar bar(10, o);
    bar.add(3);
    EXPECT_EQ("\r  30% |███       |  ", bar.str());
}

TEST_F(RendererTest, alternating_saucer_head) {
    auto o = opts();
    o.predict_time = false;
    o.elapsed_time = false;
    o.theme = {"=", "<", ">", ".", "[", "]"};
    ProgressBar bar(10, o);

    bar.add(1);
    EXPECT_EQ("\r  10% [>.........]  ", bar.str());
    bar.add(1);
    EXPECT_EQ("\r  20% [=<........]  ", bar.str());
    bar.add(1);
    EXPECT_EQ("\r  30% [==>.......]  ", bar.str());
    bar.add(7);
    EXPECT_EQ("\r 100% [==========]  ", bar.str());
}

TEST_F(RendererTest, saucer_head_without_alternative) {
    auto o = opts();
    o.predict_time = false;
    o.elapsed_time = false;
    o.theme = {"=", "", ">", " ", "[", "]"};
    ProgressBar bar(10, o);

    bar.add(4);
    EXPECT_EQ("\r  40% [===>      ]  ", bar.str());
    bar.add(1);
    EXPECT_EQ("\r  50% [====>     ]  ", bar.str());
}

TEST_F(RendererTest, full_width_fills_terminal) {
    auto o = opts();
    o.full_width = true;
    o.term_width = [] { return std::optional<int>(60); };
    ProgressBar bar(100, o);
    bar.add(50);

    // 60 columns - 10 fixed - 4 brackets - "0s" - "?"
    const std::string line = bar.str();
    EXPECT_EQ(21u, count_occurrences(line, "█"));
    EXPECT_EQ("\r  50% |", line.substr(0, 8));
    EXPECT_THAT(line, HasSubstr(std::string(22, ' ') + "|  [0s:?]"));
    EXPECT_LE(display_width(line), 60u);
}

TEST_F(RendererTest, full_width_falls_back_to_80_columns) {
    auto o = opts();
    o.full_width = true;
    ProgressBar bar(100, o);
    bar.add(100);

    // 80 - 10 - 4 - "0s" - "?"
    EXPECT_EQ(63u, count_occurrences(bar.str(), "█"));
}

TEST_F(RendererTest, full_width_ignored_for_unknown_length) {
    auto o = opts();
    o.full_width = true;
    o.term_width = [] { return std::optional<int>(60); };
    ProgressBar bar(-1, o);
    bar.add(1);
    EXPECT_EQ("\r|   [0s] ", bar.str());
}

TEST_F(RendererTest, spinner_frames_follow_clock) {
    auto o = opts();
    ProgressBar bar(-1, o);
    bar.add(1);
    EXPECT_EQ("\r|   [0s] ", bar.str());

    m_clock.advance(250ms);
    bar.add(1);
    EXPECT_EQ("\r-   [0s] ", bar.str());

    m_clock.advance(1050ms);
    bar.add(1);
    EXPECT_EQ("\r/   [1s] ", bar.str());
}

TEST_F(RendererTest, spinner_with_description_and_count) {
    auto o = opts();
    o.description = "scan";
    o.show_count = true;
    o.elapsed_time = false;
    ProgressBar bar(-1, o);
    bar.add(3);
    EXPECT_EQ("\r| scan (3/-) ", bar.str());
}

TEST_F(RendererTest, spinner_description_at_end) {
    auto o = opts();
    o.description = "scan";
    o.description_at_end = true;
    o.show_count = true;
    ProgressBar bar(-1, o);
    bar.add(3);
    EXPECT_EQ("\r| (3/-) [0s] scan ", bar.str());
}

TEST_F(RendererTest, clears_with_spaces) {
    ProgressBar bar(10, opts());
    bar.add(1);
    const std::string first = bar.str();
    const size_t w = display_width(first);
    bar.add(1);

    EXPECT_EQ(first + "\r" + std::string(w, ' ') + "\r" + bar.str(), m_out.str());
}

TEST_F(RendererTest, clears_with_ansi) {
    auto o = opts();
    o.use_ansi_codes = true;
    ProgressBar bar(10, o);
    bar.add(1);
    const std::string first = bar.str();
    bar.add(1);

    EXPECT_EQ(first + "\x1b[2K\r" + bar.str(), m_out.str());
}

TEST_F(RendererTest, color_codes) {
    auto o = opts();
    o.color_codes = true;
    o.description = "[red]job[reset] ";
    ProgressBar bar(10, o);
    bar.add(5);

    const std::string first = bar.str();
    EXPECT_THAT(first, StartsWith("\r\x1b[31mjob\x1b[0m "));
    EXPECT_THAT(first, testing::EndsWith("\x1b[0m"));
    EXPECT_THAT(first, testing::Not(HasSubstr("[red]")));

    // the clear covers visible columns only
    const size_t w = display_width(strip_ansi(first));
    bar.add(1);
    EXPECT_THAT(m_out.str(), HasSubstr("\r" + std::string(w, ' ') + "\r"));
}
