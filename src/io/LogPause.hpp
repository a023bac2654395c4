#pragma once
#include <optional>

#include "bar/OutputHooks.hpp"
#include "io/Logger.hpp"

// Silences the console sink of a Logger while the bar draws.
// The file sink, if any, keeps receiving messages.
class LogPause : public OutputHooks {
    public:
    explicit LogPause(Logger& logger) : m_logger(logger) {}

    void pause_output() noexcept override;
    void resume_output() noexcept override;

    bool paused() const { return m_guard.has_value(); }

    private:
    Logger& m_logger;
    std::optional<Logger::ConsoleLevelGuard> m_guard;
};
