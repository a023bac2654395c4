#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/common.hpp"
#include "bar/ProgressBar.hpp"

using testing::HasSubstr;
using testing::Not;

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);
size_t count_substr(const std::string& haystack, const std::string& needle);

// fixed size profile, independent of the terminal the tests run in
TerminalProfile make_profile(int columns, bool interactive);

// config writing to stdout, so capture_stdout() sees the frames
BarConfig make_config(int columns, bool interactive, OutputHooks* hooks = nullptr);

// unique marker prefix inside a per-test temp directory, removed on TearDown
class TempDirTest : public ::testing::Test {
    protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path prefix() const { return m_dir / "markers"; }
    int count_files() const;

    std::filesystem::path m_dir;
};

template <typename TCmd>
class CmdTestBase : public ::testing::Test {
    protected:
    // options only, argv[0] is added here
    void run_cmd(const std::vector<std::string>& args, int expected_code = 0) {
        TCmd cmd;
        std::vector<std::string> vargs = args;
        vargs.insert(vargs.begin(), "termbar");
        cmd.parser().parse_args(vargs);
        EXPECT_EQ(expected_code, cmd.run());
    }
};
