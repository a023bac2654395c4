#include <gtest/gtest.h>
#include "io/LogPause.hpp"

#include <sstream>
#include <spdlog/sinks/ostream_sink.h>

class LogPauseTest : public ::testing::Test {
    protected:
    LogPauseTest() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_console);
        sink->set_pattern("%v");
        auto spd = std::make_shared<spdlog::logger>("log_pause_test", sink);
        spd->set_level(spdlog::level::trace);
        m_logger = std::make_unique<Logger>(spd);
    }

    std::ostringstream m_console;
    std::unique_ptr<Logger> m_logger;
};

TEST_F(LogPauseTest, silences_console_while_paused) {
    LogPause pause(*m_logger);
    m_logger->info("before");

    pause.pause_output();
    EXPECT_TRUE(pause.paused());
    m_logger->info("during");
    m_logger->error("during error");
    pause.resume_output();
    EXPECT_FALSE(pause.paused());

    m_logger->info("after");
    EXPECT_EQ("before\nafter\n", m_console.str());
}

TEST_F(LogPauseTest, restores_previous_level) {
    m_logger->set_console_level(spdlog::level::warn);
    LogPause pause(*m_logger);

    pause.pause_output();
    EXPECT_EQ(spdlog::level::off, m_logger->console_level());
    pause.resume_output();
    EXPECT_EQ(spdlog::level::warn, m_logger->console_level());
}

TEST_F(LogPauseTest, nested_pause) {
    LogPause pause(*m_logger);
    pause.pause_output();
    pause.pause_output();
    pause.resume_output();
    EXPECT_EQ(spdlog::level::trace, m_logger->console_level());

    // resume without pause is harmless
    pause.resume_output();
    EXPECT_EQ(spdlog::level::trace, m_logger->console_level());
}
