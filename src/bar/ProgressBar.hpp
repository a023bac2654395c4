#pragma once
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "OutputHooks.hpp"
#include "core/BarOptions.hpp"
#include "core/ProgressState.hpp"
#include "core/TerminalProfile.hpp"
#include "parallel/ParallelAggregator.hpp"
#include "render/BarFormatter.hpp"
#include "render/Renderer.hpp"

// thrown when a bar is used out of order, e.g. update() after finish()
class UsageError : public std::logic_error {
    public:
    using std::logic_error::logic_error;
};

struct BarConfig {
    FILE* out = stdout;
    TerminalProfile profile;
    BarOptions options;
    OutputHooks* hooks = nullptr; // not owned, may be null

    // profile of out, probed once
    static BarConfig detect(FILE* out = stdout, int columns_override = 0);
};

/**
 * Terminal progress bar.
 *
 *   ProgressBar bar(n, "Processing {} files", n);
 *   for( size_t i = 1; i <= n; i++ ){
 *       bar.update(i);
 *       ...
 *   }
 *   bar.finish();
 *
 * Bars can be nested: an inner bar created and finished inside the loop of
 * an outer one is drawn below it and disappears on finish().
 *
 * Parallel use: call enable_parallel() before starting the workers, give each
 * worker its rank ($TERMBAR_WORKER_RANK by default, 1-based) and call update()
 * from them as usual. Only worker 1 draws, showing the total count of updates
 * made by all workers.
 */
class ProgressBar {
    public:
    template <typename... Args>
    ProgressBar(uint64_t total, fmt::format_string<Args...> message, Args&&... args)
        : ProgressBar(BarConfig::detect(), total, fmt::format(message, std::forward<Args>(args)...)) {}

    ProgressBar(const BarConfig& config, uint64_t total, const std::string& message);

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void enable_parallel(const std::filesystem::path& prefix = {}, RankSource rank = env_worker_rank);

    void update(double n){ update_impl(n, nullptr); }

    template <typename... Args>
    void update(double n, fmt::format_string<Args...> message, Args&&... args){
        const std::string text = fmt::format(message, std::forward<Args>(args)...);
        update_impl(n, &text);
    }

    void finish(){ finish_impl(nullptr); }

    template <typename... Args>
    void finish(fmt::format_string<Args...> message, Args&&... args){
        const std::string text = fmt::format(message, std::forward<Args>(args)...);
        finish_impl(&text);
    }

    // same as the templated overloads, for messages built at runtime
    void update_message(double n, const std::string& message){ update_impl(n, &message); }
    void finish_message(const std::string& message){ finish_impl(&message); }

    bool finished() const { return m_finished; }
    bool parallel() const { return m_aggregator != nullptr; }
    const ProgressState& state() const { return m_state; }
    const TerminalProfile& profile() const { return m_config.profile; }
    std::chrono::steady_clock::duration elapsed() const;

    private:
    void update_impl(double n, const std::string* message);
    void finish_impl(const std::string* message);
    void render(bool new_message);
    void check_usable(const char* method) const;

    void pause_output() const { if( m_config.hooks ) m_config.hooks->pause_output(); }
    void resume_output() const { if( m_config.hooks ) m_config.hooks->resume_output(); }

    BarConfig m_config;
    ProgressState m_state;
    BarFormatter m_formatter;
    std::unique_ptr<Renderer> m_renderer;
    std::unique_ptr<ParallelAggregator> m_aggregator;
    bool m_finished = false;
};
