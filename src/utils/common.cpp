/**
 * @file common.cpp
 * @brief Implementation of common utilities and global variables.
 *
 * Holds the global logger, the argument parser and the settings shared by
 * all subcommands (verbosity, forced terminal width, render mode), plus the
 * crash handler that prints a stack trace on SIGSEGV/SIGABRT.
 */

#include "common.hpp"
#include "bar/ProgressBar.hpp"
#include "io/LogPause.hpp"
#include "dist/version.h"

int verbosity = 0;
int g_columns = 0; // 0 = probe the terminal
BarOptions g_bar_options;

std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::get(""));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

/**
 * @brief Backtrace error callback for logging libbacktrace errors.
 * @param msg Error message.
 * @param errnum Error number.
 */
void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "?", lineno, function ? function : "?");
    return 0;
}

void signal_handler(int sig) {
    // the bar may have left the cursor mid-line with colors enabled
    fmt::print(stderr, ANSI_COLOR_RESET "\n");
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

/**
 * @brief Replaces control characters with '.' so a message cannot move the cursor.
 *
 * Bytes >= 0x80 are kept as is, UTF-8 messages pass through untouched.
 *
 * @param str Message text.
 * @return Sanitized copy of the message.
 */
std::string filter_control_chars(const std::string& str){
    std::string result;
    result.reserve(str.size());
    for( char c : str ){
        unsigned char uc = static_cast<unsigned char>(c);
        if( uc < 0x20 || uc == 0x7f ){
            result += '.';
        } else {
            result += c;
        }
    }
    return result;
}

void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }

    inited = true;
    if( !log_fname.empty() ){
        // explicit log pathname, can't continue without log
        if( !logger->add_file(log_fname) ){
            logger->critical("explicit log pathname is set, refusing to continue without log");
            exit(1);
        }
    }
    logger->start();
}

BarConfig cli_bar_config(){
    static LogPause log_pause(*logger);

    BarConfig config = BarConfig::detect(stdout, g_columns);
    config.options = g_bar_options;
    config.hooks = &log_pause;
    return config;
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-C", "--columns")
        .help("terminal width [default: probe the terminal, 80 if that fails]")
        .store_into(g_columns);

    auto &mode = parser.add_mutually_exclusive_group();
    mode.add_argument("--ansi")
        .help("always draw the ANSI color bar")
        .action([&](const auto &) { g_bar_options.mode = RenderMode::Ansi; })
        .implicit_value(true)
        .nargs(0);
    mode.add_argument("--block")
        .help("always draw the block character bar")
        .action([&](const auto &) { g_bar_options.mode = RenderMode::Block; })
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("--true-color")
        .implicit_value(true)
        .store_into(g_bar_options.true_color)
        .help("use a 24-bit color gradient for the filled part of the bar");

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
