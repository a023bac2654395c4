/**
 * @file DemoCommand.cpp
 * @brief Sequential progress bar over a fixed number of items.
 */

#include "DemoCommand.hpp"
#include "bar/ProgressBar.hpp"

#include <thread>

REGISTER_COMMAND(DemoCommand);

DemoCommand::DemoCommand(bool reg) : Command(reg, "demo", "run a progress bar over N items") {
    m_parser.add_argument("-n", "--count").default_value(300).scan<'i', int>().help("number of items");
    m_parser.add_argument("-m", "--message").help("bar message [default: \"Running demo with N items\"]");
    m_parser.add_argument("-d", "--delay-ms").default_value(10).scan<'i', int>().help("time spent on each item");
    m_parser.add_argument("-s", "--summary").default_value(false).implicit_value(true).help("print a summary line on finish");
}

int DemoCommand::run() {
    const int count = m_parser.get<int>("--count");
    const int delay = m_parser.get<int>("--delay-ms");
    if( count < 0 || delay < 0 ){
        logger->error("--count and --delay-ms must not be negative");
        return 1;
    }

    std::string message = m_parser.present("--message").value_or(fmt::format("Running demo with {} items", count));

    ProgressBar bar(cli_bar_config(), count, message);
    for( int i = 1; i <= count; i++ ){
        bar.update(i);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    if( m_parser.get<bool>("--summary") ){
        bar.finish("{} items in {}", count, elapsed2human(bar.elapsed()));
    } else {
        bar.finish();
    }
    logger->debug("demo: {} items in {}", count, elapsed2human(bar.elapsed()));
    return 0;
}
