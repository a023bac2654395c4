/**
 * @file Logger.cpp
 * @brief Logger wrapper around spdlog.
 *
 * Console sink plus an optional file sink, integer verbosity levels,
 * per-format deduplication of warnings and errors, and a console level that
 * can be changed independently of the file sink (used to keep log lines out
 * of the progress bar while it is being drawn).
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <algorithm>
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    static const spdlog::level::level_enum levels[] = {
        spdlog::level::off,
        spdlog::level::critical,
        spdlog::level::err,
        spdlog::level::warn,
        spdlog::level::info,
        spdlog::level::debug,
        spdlog::level::trace,
    };
    int idx = std::clamp(verbosity + 4, 0, 6);
    m_logger->set_level(levels[idx]);
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

bool Logger::suppressed(spdlog::level::level_enum lvl, fmt::string_view format, fmt::format_args args){
    if( m_dedup_limit <= 0 ){
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mtx);
    int n = m_logged_messages[format]++; // count the format string, not the arguments
    if( n < m_dedup_limit ){
        return false;
    }
    if( n == m_dedup_limit ){
        std::string message = fmt::vformat(format, args);
        m_logger->log(lvl, "{} [repeated {} times. suppressing]", message, m_dedup_limit);
    }
    return true;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and receives DEBUG or higher, the
 * console keeps the level selected by -v/-q. A second call is ignored.
 *
 * @param fname Path to the log file.
 * @return True if the file sink was added.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level()); // move current level to console sink
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information: banner, arguments and log target.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("{}", m_banner);
    }

    m_logger->debug("started as {}", fmt::join(m_arguments, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}

spdlog::level::level_enum Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
