#include "test_utils.hpp"
#include "io/Logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out);
        sink->set_pattern("%l %v");
        m_spd = std::make_shared<spdlog::logger>("logger_test", sink);
        m_logger = std::make_unique<Logger>(m_spd);
    }

    std::vector<std::string> lines() {
        m_spd->flush();
        return split(m_out.str(), '\n');
    }

    std::ostringstream m_out;
    std::shared_ptr<spdlog::logger> m_spd;
    std::unique_ptr<Logger> m_logger;
};

TEST_F(LoggerTest, verbosity_levels) {
    m_logger->set_verbosity(-4);
    EXPECT_EQ(spdlog::level::off, m_logger->level());
    m_logger->set_verbosity(-3);
    EXPECT_EQ(spdlog::level::critical, m_logger->level());
    m_logger->set_verbosity(-1);
    EXPECT_EQ(spdlog::level::warn, m_logger->level());
    m_logger->set_verbosity(0);
    EXPECT_EQ(spdlog::level::info, m_logger->level());
    m_logger->set_verbosity(1);
    EXPECT_EQ(spdlog::level::debug, m_logger->level());
    m_logger->set_verbosity(5);
    EXPECT_EQ(spdlog::level::trace, m_logger->level());
}

TEST_F(LoggerTest, level_filters_messages) {
    m_logger->set_verbosity(-1);
    m_logger->info("hidden {}", 1);
    m_logger->warn("shown {}", 2);
    EXPECT_EQ(std::vector<std::string>{"warning shown 2"}, lines());
}

TEST_F(LoggerTest, dedup_limit) {
    m_logger->set_dedup_limit(2);
    for( int i = 0; i < 5; i++ ){
        m_logger->warn("terminal width unavailable for fd {}", i);
    }
    m_logger->warn("other message");

    auto l = lines();
    ASSERT_EQ(4u, l.size());
    EXPECT_EQ("warning terminal width unavailable for fd 0", l[0]);
    EXPECT_EQ("warning terminal width unavailable for fd 1", l[1]);
    EXPECT_THAT(l[2], HasSubstr("[repeated 2 times. suppressing]"));
    EXPECT_EQ("warning other message", l[3]);
}

TEST_F(LoggerTest, no_dedup_by_default) {
    for( int i = 0; i < 5; i++ ){
        m_logger->error("write failed");
    }
    EXPECT_EQ(5u, lines().size());
}

TEST_F(LoggerTest, warn_once) {
    for( int i = 0; i < 3; i++ ){
        m_logger->warn_once("spinner {} unsupported", i);
    }
    EXPECT_EQ(std::vector<std::string>{"warning spinner 0 unsupported"}, lines());
}

TEST_F(LoggerTest, start_banner) {
    m_logger->set_verbosity(0);
    m_logger->set_banner("tickbar 1.0.0");
    m_logger->set_arguments({"tickbar-cli", "basic", "-D", "two words"});
    m_logger->start();

    std::string out = m_out.str();
    EXPECT_THAT(out, HasSubstr("tickbar 1.0.0"));
    EXPECT_THAT(out, HasSubstr("started as tickbar-cli basic -D \"two words\""));
    EXPECT_THAT(out, HasSubstr("logging to console only"));
}
