/**
 * @file TestCommand.cpp
 * @brief Self-test of the bar layout, run before every other command.
 *
 * Formats a few known frames and checks the parts whose exact text other
 * tools may parse out of captured logs.
 */

#include "TestCommand.hpp"
#include "render/BarFormatter.hpp"
#include "render/BlockRenderer.hpp"

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

static bool expect_text(const char* what, const std::string& actual, const std::string& expected){
    logger->trace("selftest: {:<12} = \"{}\"", what, actual);
    if( actual != expected ){
        logger->critical("selftest: {} is \"{}\", expected \"{}\"", what, actual, expected);
        return false;
    }
    return true;
}

int TestCommand::run() {
    TerminalProfile profile;
    profile.columns = 80;
    profile.interactive = true;
    BarFormatter formatter(profile);

    ProgressState ratio_state;
    ratio_state.total = 1;
    ratio_state.set_current(0.5);

    ProgressState count_state;
    count_state.total = 10;
    count_state.set_current(3);

    ProgressState long_state;
    long_state.total = 1;
    long_state.message = std::string(100, 'x');

    const Layout ratio = formatter.format(ratio_state);
    const Layout count = formatter.format(count_state);
    const Layout truncated = formatter.format(long_state);

    bool ok = true;
    ok &= expect_text("ratio mode", ratio.progress_text, "[ 50.0% ]");
    ok &= expect_text("count mode", count.progress_text, "3 / 10 [ 20.0% ]");
    ok &= expect_text("label", truncated.label_text, std::string(80 - 9 - 6, 'x') + "...");
    ok &= expect_text("half block", std::string(fractional_block(0.5)), "▌");

    if( ratio.line.size() != static_cast<size_t>(profile.columns - 2) ){
        logger->critical("selftest: line width {} != {}", ratio.line.size(), profile.columns - 2);
        ok = false;
    }

    if( !ok ){
        return 1;
    }
    logger->trace("selftest: OK");
    return 0;
}
