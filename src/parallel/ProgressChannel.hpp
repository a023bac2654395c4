#pragma once
#include <cstdint>

// Append-only counter shared by several processes. Appends from different
// workers never conflict, total() is the number of appends visible so far
// (it may lag behind, it never exceeds the real count).
class ProgressChannel {
    public:
    virtual ~ProgressChannel() = default;

    // throws std::runtime_error if the unit can't be recorded
    virtual void append(int rank) = 0;
    virtual uint64_t total() const = 0;

    // best effort, must not throw
    virtual void clear() noexcept = 0;
};
