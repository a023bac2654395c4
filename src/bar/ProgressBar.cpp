/**
 * @file ProgressBar.cpp
 * @brief Progress bar lifecycle: construction, updates, parallel mode and finish.
 */

#include "ProgressBar.hpp"
#include "render/AnsiRenderer.hpp"
#include "render/BlockRenderer.hpp"
#include "utils/common.hpp"

BarConfig BarConfig::detect(FILE* out, int columns_override){
    BarConfig config;
    config.out = out;
    config.profile = TerminalProfile::detect(out, columns_override);
    return config;
}

// the forced render mode wins over what the stream looks like
static TerminalProfile effective_profile(TerminalProfile profile, RenderMode mode){
    if( mode == RenderMode::Ansi ){
        profile.interactive = true;
    } else if( mode == RenderMode::Block ){
        profile.interactive = false;
    }
    return profile;
}

static BarConfig effective_config(BarConfig config){
    config.profile = effective_profile(config.profile, config.options.mode);
    if( config.profile.columns < 1 ){
        config.profile.columns = TerminalSize().columns;
    }
    return config;
}

ProgressBar::ProgressBar(const BarConfig& config, uint64_t total, const std::string& message)
    : m_config(effective_config(config)), m_formatter(m_config.profile)
{
    if( m_config.profile.interactive ){
        m_renderer = std::make_unique<AnsiRenderer>(m_config.out, m_config.profile, m_config.options);
    } else {
        m_renderer = std::make_unique<BlockRenderer>(m_config.out, m_config.profile);
    }

    m_state.total = total;
    m_state.message = filter_control_chars(message);
    m_state.started_at = std::chrono::steady_clock::now();

    logger->trace("bar \"{}\": total={} columns={} {}", m_state.message, total, m_config.profile.columns,
            m_config.profile.interactive ? "ansi" : "block");
    update_impl(0, nullptr);
}

void ProgressBar::check_usable(const char* method) const {
    if( m_finished ){
        throw UsageError(fmt::format("ProgressBar::{}: used after finish", method));
    }
}

void ProgressBar::enable_parallel(const fs::path& prefix, RankSource rank){
    check_usable("enable_parallel");
    if( m_aggregator ){
        return;
    }
    m_aggregator = ParallelAggregator::enable(prefix, std::move(rank));

    if( m_config.profile.interactive ){
        // parallel frames start one line below the bar and move up to it
        pause_output();
        fmt::print(m_config.out, "\n");
        fflush(m_config.out);
        resume_output();
    }
}

void ProgressBar::update_impl(double n, const std::string* message){
    check_usable("update");

    if( m_aggregator ){
        std::optional<double> resolved = m_aggregator->resolve(n);
        if( !resolved ){
            return; // not the reporter
        }
        n = *resolved;
    }

    bool new_message = false;
    if( message ){
        m_state.message = filter_control_chars(*message);
        new_message = true;
    }
    m_state.set_current(n);
    render(new_message);
}

void ProgressBar::render(bool new_message){
    Frame frame;
    frame.first = m_state.first_update;
    frame.new_message = new_message || m_state.first_update;
    frame.parallel = m_aggregator != nullptr;

    const Layout layout = m_formatter.format(m_state);

    pause_output();
    m_renderer->draw(layout, frame);
    resume_output();

    m_state.first_update = false;
}

void ProgressBar::finish_impl(const std::string* message){
    check_usable("finish");

    pause_output();
    m_renderer->erase(m_aggregator != nullptr);
    if( message ){
        m_state.message = filter_control_chars(*message);
        fmt::print(m_config.out, "{}\n", m_state.message);
        fflush(m_config.out);
    }
    resume_output();

    if( m_aggregator ){
        m_aggregator->cleanup();
    }
    m_finished = true;
}

std::chrono::steady_clock::duration ProgressBar::elapsed() const {
    return std::chrono::steady_clock::now() - m_state.started_at;
}
