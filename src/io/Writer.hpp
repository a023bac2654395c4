#pragma once
#include <filesystem>

// Thin fd-based writer. In APPEND mode every write() lands at the current end
// of file even when several processes write the same file (O_APPEND).
class Writer {
    public:
    enum class Mode { Truncate, Append };

    explicit Writer(const std::filesystem::path& fname, Mode mode = Mode::Truncate);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(const void* buf, size_t count) const;

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
};
