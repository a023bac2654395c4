/**
 * @file Writer.cpp
 * @brief File writer used for marker files and other small outputs.
 *
 * Retries interrupted writes and reports every failure as std::runtime_error
 * carrying the failing call and strerror(errno).
 */

#include "Writer.hpp"
#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

/**
 * @brief Opens (creating if needed) a file for writing.
 *
 * @param fname Path to file to create/open.
 * @param mode Truncate an existing file, or append to it.
 * @throws std::runtime_error If file cannot be created/opened.
 */
Writer::Writer(const std::filesystem::path& fname, Mode mode) : m_fname(fname) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (mode == Mode::Append ? O_APPEND : O_TRUNC);
    m_fd = open(fname.c_str(), flags, 0644);
    if (m_fd == -1) {
        throw std::runtime_error(fmt::format("Writer: open(\"{}\", {:#x}, 0644): {}", fname.string(), flags, strerror(errno)));
    }
}

/**
 * @brief Writes the whole buffer.
 *
 * A single write() of a small buffer on an O_APPEND descriptor is atomic with
 * respect to other appenders, larger buffers may be split.
 *
 * @param buf Buffer containing data to write.
 * @param count Number of bytes to write.
 * @throws std::runtime_error On write error or if write returns 0 bytes.
 */
void Writer::write(const void* buf, size_t count) const {
    const char* ptr = static_cast<const char*>(buf);

    while (count > 0) {
        ssize_t nwritten = ::write(m_fd, ptr, count);
        if (nwritten == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(fmt::format("Writer: write(\"{}\", {}): {}", m_fname.string(), count, strerror(errno)));
        }
        if (nwritten == 0) {
            throw std::runtime_error(fmt::format("Writer: write(\"{}\", {}): write returned 0 bytes", m_fname.string(), count));
        }
        ptr += nwritten;
        count -= nwritten;
    }
}

Writer::~Writer() {
    if( m_fd != -1 ){
        close(m_fd);
        m_fd = -1;
    }
}
