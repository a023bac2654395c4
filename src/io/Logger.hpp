#pragma once
#include <unordered_map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <spdlog/spdlog.h>

// hash function for fmt::string_view<char> to use in unordered_map
namespace std {
template <>
    struct hash<fmt::basic_string_view<char>> {
        size_t operator()(const fmt::basic_string_view<char>& s) const noexcept {
            return std::hash<std::string_view>{}(std::string_view(s.data(), s.size()));
        }
    };
}

class Logger {
public:
    using level = spdlog::level::level_enum;

    // sets the console sink level for the lifetime of the guard
    class ConsoleLevelGuard {
        Logger& logger;
        spdlog::level::level_enum prev;

        public:
        ConsoleLevelGuard(Logger& logger, spdlog::level::level_enum new_level)
            : logger(logger), prev(logger.console_level()) {
                logger.set_console_level(new_level);
            }

        ~ConsoleLevelGuard() {
            logger.set_console_level(prev);
        }
    };

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        if( suppressed(spdlog::level::warn, format, fmt::make_format_args(args...)) ){
            return;
        }
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        if( suppressed(spdlog::level::err, format, fmt::make_format_args(args...)) ){
            return;
        }
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    void flush() { m_logger->flush(); }

    // get/set console level
    spdlog::level::level_enum console_level() const;
    void set_console_level(spdlog::level::level_enum level);

private:
    // true if the format string was already logged m_dedup_limit times,
    // the last one logged carries the formatted message and a suppression note
    bool suppressed(spdlog::level::level_enum lvl, fmt::string_view format, fmt::format_args args);

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// Custom formatter for std::filesystem::path, which is not supported by spdlog by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
