#include <gtest/gtest.h>
#include "test_utils.hpp"

TEST(common, filter_control_chars) {
    EXPECT_EQ("plain text", filter_control_chars("plain text"));
    EXPECT_EQ("a.b.c", filter_control_chars("a\nb\rc"));
    EXPECT_EQ(".[2J", filter_control_chars("\x1b[2J"));
    EXPECT_EQ("del.", filter_control_chars("del\x7f"));
    EXPECT_EQ("ünïcödé ▌", filter_control_chars("ünïcödé ▌"));
    EXPECT_EQ("", filter_control_chars(""));
}

class CommonArgsTest : public ::testing::Test {
    protected:
    void SetUp() override {
        register_common_args(m_parser);
    }

    void TearDown() override {
        g_columns = 0;
        g_bar_options = BarOptions{};
    }

    argparse::ArgumentParser m_parser{"./app", "", argparse::default_arguments::none};
};

TEST_F(CommonArgsTest, defaults) {
    m_parser.parse_args({"./app"});
    EXPECT_EQ(0, g_columns);
    EXPECT_EQ(RenderMode::Auto, g_bar_options.mode);
    EXPECT_FALSE(g_bar_options.true_color);
    EXPECT_EQ(100, m_parser.get<int>("--log-dedup-limit"));
}

TEST_F(CommonArgsTest, bar_options) {
    m_parser.parse_args({"./app", "--block", "-C", "120", "--true-color"});
    EXPECT_EQ(120, g_columns);
    EXPECT_EQ(RenderMode::Block, g_bar_options.mode);
    EXPECT_TRUE(g_bar_options.true_color);
}

TEST_F(CommonArgsTest, ansi_and_block_exclusive) {
    EXPECT_THROW(m_parser.parse_args({"./app", "--ansi", "--block"}), std::exception);
}

TEST_F(CommonArgsTest, cli_bar_config) {
    m_parser.parse_args({"./app", "--ansi", "-C", "50"});
    BarConfig config = cli_bar_config();
    EXPECT_EQ(50, config.profile.columns);
    EXPECT_EQ(RenderMode::Ansi, config.options.mode);
    EXPECT_NE(nullptr, config.hooks);
    EXPECT_EQ(stdout, config.out);
}
