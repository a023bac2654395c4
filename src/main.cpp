/**
 * @file main.cpp
 * @brief Main entry point for the termbar tool.
 *
 * Parses the command line, sets up logging and runs the selected
 * subcommand after a silent self-test.
 */

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;

int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        logger->set_verbosity(verbosity); // subcommand may have changed it
        if( cmd->parser().is_used("--log") ){
            init_log(cmd->parser().get<std::string>("--log"));
        } else {
            init_log(program.present("--log").value_or(""));
        }

        if( name == TEST_CMD_NAME ){
            // explicit self-test, make it visible
            logger->set_verbosity(9);
        } else if( selfTestCmd->run() != 0 ){
            logger->critical("self-test failed, exiting");
            return 1;
        }

        try {
            return cmd->run();
        } catch (const std::exception& e) {
            fmt::print(ANSI_COLOR_RESET "\n");
            logger->critical("{}: {}", name, e.what());
            return 1;
        }
    }

    std::cout << program;
    return 0;
}
