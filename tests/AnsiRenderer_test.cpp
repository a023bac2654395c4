#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "render/AnsiRenderer.hpp"

class AnsiRendererTest : public ::testing::Test {
    protected:
    Layout layout_for(double ratio, int columns = 40) {
        ProgressState state;
        state.total = 1;
        state.message = "work";
        state.set_current(ratio);
        return BarFormatter(make_profile(columns, true)).format(state);
    }

    std::string draw(AnsiRenderer& r, const Layout& layout, bool first, bool parallel = false) {
        Frame frame;
        frame.first = first;
        frame.new_message = first;
        frame.parallel = parallel;
        return capture_stdout([&]{ r.draw(layout, frame); });
    }
};

TEST_F(AnsiRendererTest, first_frame_keeps_callers_text) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    Layout layout = layout_for(0.5);
    std::string out = draw(r, layout, true);

    std::string filled = layout.line.substr(0, layout.split_index);
    std::string unfilled = layout.line.substr(layout.split_index);
    EXPECT_EQ(" \b\r\x1b[1;44;37m " + filled + "\x1b[49;37m" + unfilled + "\x1b[0m ", out);
}

TEST_F(AnsiRendererTest, later_frames_overwrite_the_line) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    std::string out = draw(r, layout_for(0.25), false);

    EXPECT_EQ(0u, out.find("\b\r\x1b[1;44;37m "));
    EXPECT_THAT(out, HasSubstr("[ 25.0% ]"));
    EXPECT_THAT(out, Not(HasSubstr("\n")));
}

TEST_F(AnsiRendererTest, filled_part_is_split_at_split_index) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    Layout layout = layout_for(0.5);
    ASSERT_EQ(20u, layout.split_index);
    std::string out = draw(r, layout, false);

    EXPECT_THAT(out, HasSubstr("\x1b[1;44;37m " + layout.line.substr(0, 20) + "\x1b[49;37m"));
}

TEST_F(AnsiRendererTest, parallel_frame_moves_up_and_ends_with_newline) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    std::string out = draw(r, layout_for(0.5), false, true);

    EXPECT_EQ(0u, out.find("\x1b[1A\x1b[1;44;37m "));
    EXPECT_EQ(" \n", out.substr(out.size() - 2));
    EXPECT_THAT(out, Not(HasSubstr("\r")));
}

TEST_F(AnsiRendererTest, erase_blanks_the_line) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    std::string out = capture_stdout([&]{ r.erase(false); });
    EXPECT_EQ("\b\r" + std::string(39, ' ') + "\x1b[0m\r", out);

    out = capture_stdout([&]{ r.erase(true); });
    EXPECT_EQ("\x1b[1A" + std::string(39, ' ') + "\x1b[0m\r", out);
}

TEST_F(AnsiRendererTest, same_layout_same_frame) {
    AnsiRenderer r(stdout, make_profile(40, true), BarOptions{});
    Layout layout = layout_for(0.6);
    EXPECT_EQ(draw(r, layout, false), draw(r, layout, false));
}

TEST(Gradient, hsv2rgb) {
    EXPECT_EQ((rgb_t{102, 255, 255}), hsv2rgb(0.5, 0.6, 1.0));
    EXPECT_EQ((rgb_t{255, 0, 0}), hsv2rgb(0.0, 1.0, 1.0));
    EXPECT_EQ((rgb_t{0, 0, 0}), hsv2rgb(0.3, 0.5, 0.0));
}

TEST(Gradient, one_sample_per_column) {
    std::vector<rgb_t> g = make_gradient(80, 0.5, 0.6);
    ASSERT_EQ(80u, g.size());
    for (const auto& c : g) {
        // cyan: red is the darkest channel, green == blue
        EXPECT_LT(c[0], c[1]);
        EXPECT_EQ(c[1], c[2]);
    }
    EXPECT_NE(g[0], g[10]);
}

TEST_F(AnsiRendererTest, true_color_wraps_each_filled_char) {
    BarOptions options;
    options.true_color = true;
    AnsiRenderer r(stdout, make_profile(40, true), options);
    ASSERT_EQ(40u, r.gradient().size());

    Layout layout = layout_for(0.5);
    std::string out = draw(r, layout, false);

    EXPECT_EQ(layout.split_index, count_substr(out, "\x1b[48;2;"));
    EXPECT_THAT(out, Not(HasSubstr("\x1b[1;44;37m")));
    const rgb_t& c = r.gradient()[0];
    EXPECT_EQ(0u, out.find(fmt::format("\b\r\x1b[48;2;{};{};{}m{}", c[0], c[1], c[2], layout.line[0])));
}

TEST_F(AnsiRendererTest, true_color_keeps_multibyte_chars_whole) {
    BarOptions options;
    options.true_color = true;
    AnsiRenderer r(stdout, make_profile(40, true), options);

    ProgressState state;
    state.total = 1;
    state.message = "éééééééééé";
    state.set_current(0.5);
    Layout layout = BarFormatter(make_profile(40, true)).format(state);
    ASSERT_EQ(30u, layout.split_index); // 10 x "é" + 10 spaces

    std::string out = draw(r, layout, false);

    EXPECT_EQ(20u, count_substr(out, "\x1b[48;2;"));
    const auto& g = r.gradient();
    std::string head = "\b\r";
    for( int i = 0; i < 2; i++ ){
        head += fmt::format("\x1b[48;2;{};{};{}m{}", g[i][0], g[i][1], g[i][2], "é");
    }
    EXPECT_EQ(0u, out.find(head));
}
