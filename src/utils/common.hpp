#pragma once
#include "io/Logger.hpp"
#include "units.hpp"
#include "core/BarOptions.hpp"

#include <string>
#include <filesystem>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "TermBar"

#define ANSI_CURSOR_UP     "\x1b[1A"
#define ANSI_BAR_FILLED    "\x1b[1;44;37m"
#define ANSI_BAR_EMPTY     "\x1b[49;37m"
#define ANSI_COLOR_RESET   "\x1b[0m"

#define WORKER_RANK_ENV    "TERMBAR_WORKER_RANK"

struct BarConfig;

extern std::shared_ptr<Logger> logger;
extern int verbosity;
extern int g_columns;
extern BarOptions g_bar_options;

void init_log(const std::string& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);

// bar configuration assembled from the command line options
BarConfig cli_bar_config();

std::string filter_control_chars(const std::string& str);
