#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <sys/types.h>

#include "ProgressChannel.hpp"

// rank of the calling process, 0 outside of a worker
using RankSource = std::function<int()>;

// reads the rank from $TERMBAR_WORKER_RANK
int env_worker_rank();

// Lets worker processes advance one shared counter. Every worker update is
// appended to the channel; worker 1 (the reporter) turns the channel total
// into the value to render, the others render nothing.
class ParallelAggregator {
    public:
    static constexpr int REPORTER_RANK = 1;

    ParallelAggregator(std::unique_ptr<ProgressChannel> channel, RankSource rank = env_worker_rank);
    ~ParallelAggregator();

    ParallelAggregator(const ParallelAggregator&) = delete;
    ParallelAggregator& operator=(const ParallelAggregator&) = delete;

    // marker files under prefix (a fresh unique one if empty), stale markers removed
    static std::unique_ptr<ParallelAggregator> enable(const std::filesystem::path& prefix = {}, RankSource rank = env_worker_rank);

    // value to render for an update(n), nullopt if this process must not render
    std::optional<double> resolve(double n);

    // removes the channel contents, only in the process that created the aggregator
    void cleanup() noexcept;

    ProgressChannel& channel() { return *m_channel; }

    private:
    std::unique_ptr<ProgressChannel> m_channel;
    RankSource m_rank;
    pid_t m_owner;
};
