/**
 * @file NestedCommand.cpp
 * @brief Outer bar with a fresh inner bar for every outer item.
 *
 * On a terminal the inner bar takes over the line while it runs, its
 * finish() blanks it and the next outer update draws the outer bar again.
 */

#include "NestedCommand.hpp"
#include "bar/ProgressBar.hpp"

#include <thread>

REGISTER_COMMAND(NestedCommand);

NestedCommand::NestedCommand(bool reg) : Command(reg, "nested", "run an inner bar inside every step of an outer one") {
    m_parser.add_argument("--outer").default_value(20).scan<'i', int>().help("outer loop items");
    m_parser.add_argument("--inner").default_value(100).scan<'i', int>().help("inner loop items");
    m_parser.add_argument("-d", "--delay-ms").default_value(1).scan<'i', int>().help("time spent on each inner item");
}

int NestedCommand::run() {
    const int outer = m_parser.get<int>("--outer");
    const int inner = m_parser.get<int>("--inner");
    const int delay = m_parser.get<int>("--delay-ms");
    if( outer < 0 || inner < 0 || delay < 0 ){
        logger->error("--outer, --inner and --delay-ms must not be negative");
        return 1;
    }

    const BarConfig config = cli_bar_config();
    ProgressBar outer_bar(config, outer, "Outer loop");
    for( int i = 1; i <= outer; i++ ){
        outer_bar.update(i);

        ProgressBar inner_bar(config, inner, "Inner loop");
        for( int j = 1; j <= inner; j++ ){
            inner_bar.update(j);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        inner_bar.finish();
    }
    outer_bar.finish();
    return 0;
}
