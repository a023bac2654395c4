#include "LogPause.hpp"

void LogPause::pause_output() noexcept {
    if( m_guard ){
        return; // nested pause, keep the outermost saved level
    }
    m_logger.flush();
    m_guard.emplace(m_logger, spdlog::level::off);
}

void LogPause::resume_output() noexcept {
    m_guard.reset();
}
