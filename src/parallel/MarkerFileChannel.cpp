/**
 * @file MarkerFileChannel.cpp
 * @brief Cross-process progress counter made of append-only marker files.
 *
 * Each worker only ever appends to its own file, so no locking is needed.
 * The reader lists the directory and sums file sizes. An append that is not
 * visible yet is counted by a later read.
 */

#include "MarkerFileChannel.hpp"
#include "io/Writer.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <random>
#include <unistd.h>

MarkerFileChannel::MarkerFileChannel(fs::path prefix) : m_prefix(std::move(prefix)) {
    if( m_prefix.filename().empty() ){
        throw std::invalid_argument(fmt::format("MarkerFileChannel: prefix \"{}\" has no file name part", m_prefix));
    }
}

fs::path MarkerFileChannel::unique_prefix(){
    static std::mt19937_64 rng(std::random_device{}());
    return fs::temp_directory_path() / fmt::format("termbar_{}_{:016x}", getpid(), rng());
}

fs::path MarkerFileChannel::marker_path(int rank) const {
    return m_prefix.parent_path() / fmt::format("{}_{}", m_prefix.filename(), rank);
}

bool MarkerFileChannel::is_marker(const fs::path& fname) const {
    const std::string name = fname.filename().string();
    const std::string stem = m_prefix.filename().string() + "_";
    if( name.size() <= stem.size() || name.compare(0, stem.size(), stem) != 0 ){
        return false;
    }
    return std::all_of(name.begin() + stem.size(), name.end(), [](char c){ return c >= '0' && c <= '9'; });
}

void MarkerFileChannel::append(int rank){
    Writer w(marker_path(rank), Writer::Mode::Append);
    w.write(".", 1);
}

std::vector<fs::path> MarkerFileChannel::list_markers() const {
    std::vector<fs::path> markers;
    const fs::path dir = m_prefix.parent_path().empty() ? fs::path(".") : m_prefix.parent_path();

    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    for( ; !ec && it != end; it.increment(ec) ){
        if( is_marker(it->path()) ){
            markers.push_back(it->path());
        }
    }
    if( ec ){
        logger->debug("marker scan of {}: {}", dir, ec.message());
    }
    return markers;
}

uint64_t MarkerFileChannel::total() const {
    uint64_t sum = 0;
    for( const auto& marker : list_markers() ){
        std::error_code ec;
        uintmax_t size = fs::file_size(marker, ec);
        if( ec ){
            // removed between listing and stat
            continue;
        }
        sum += size;
    }
    return sum;
}

void MarkerFileChannel::clear() noexcept {
    for( const auto& marker : list_markers() ){
        std::error_code ec;
        if( !fs::remove(marker, ec) && ec ){
            logger->debug("can't remove marker {}: {}", marker, ec.message());
        }
    }
}
