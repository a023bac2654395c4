/**
 * @file ParallelAggregator.cpp
 * @brief Resolution of progress values in multi-process runs.
 */

#include "ParallelAggregator.hpp"
#include "MarkerFileChannel.hpp"
#include "utils/common.hpp"

#include <cstdlib>
#include <unistd.h>

int env_worker_rank(){
    const char* value = std::getenv(WORKER_RANK_ENV);
    if( !value || !*value ){
        return 0;
    }
    char* end = nullptr;
    long rank = std::strtol(value, &end, 10);
    if( *end != 0 || rank < 1 || rank > 0xffff ){
        logger->warn("ignoring invalid {}=\"{}\"", WORKER_RANK_ENV, value);
        return 0;
    }
    return static_cast<int>(rank);
}

ParallelAggregator::ParallelAggregator(std::unique_ptr<ProgressChannel> channel, RankSource rank)
    : m_channel(std::move(channel)), m_rank(std::move(rank)), m_owner(getpid())
{
}

ParallelAggregator::~ParallelAggregator(){
    cleanup();
}

std::unique_ptr<ParallelAggregator> ParallelAggregator::enable(const fs::path& prefix, RankSource rank){
    auto channel = std::make_unique<MarkerFileChannel>(prefix.empty() ? MarkerFileChannel::unique_prefix() : prefix);
    logger->debug("parallel progress markers: {}_*", channel->prefix());
    channel->clear();
    return std::make_unique<ParallelAggregator>(std::move(channel), std::move(rank));
}

std::optional<double> ParallelAggregator::resolve(double n){
    const int rank = m_rank ? m_rank() : 0;
    if( rank < 1 ){
        // not inside a worker, the caller's value stands
        return n;
    }

    try {
        m_channel->append(rank);
    } catch( const std::exception& e ){
        // a lost marker is an undercount, the caller's loop goes on
        logger->warn("worker {}: can't record progress: {}", rank, e.what());
    }
    if( rank != REPORTER_RANK ){
        return std::nullopt;
    }
    return static_cast<double>(m_channel->total());
}

void ParallelAggregator::cleanup() noexcept {
    // forked workers inherit the aggregator, the channel belongs to the parent
    if( getpid() != m_owner ){
        return;
    }
    m_channel->clear();
}
