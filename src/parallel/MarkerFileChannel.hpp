#pragma once
#include <filesystem>
#include <vector>

#include "ProgressChannel.hpp"

// One file per worker, "<prefix>_<rank>", one byte per append.
// The total is the sum of the file sizes.
class MarkerFileChannel : public ProgressChannel {
    public:
    explicit MarkerFileChannel(std::filesystem::path prefix);

    // fresh prefix in the temp directory, unique per process and call
    static std::filesystem::path unique_prefix();

    void append(int rank) override;
    uint64_t total() const override;
    void clear() noexcept override;

    const std::filesystem::path& prefix() const { return m_prefix; }
    std::filesystem::path marker_path(int rank) const;

    // true if fname is "<prefix filename>_<digits>"
    bool is_marker(const std::filesystem::path& fname) const;

    private:
    std::vector<std::filesystem::path> list_markers() const;

    std::filesystem::path m_prefix;
};
