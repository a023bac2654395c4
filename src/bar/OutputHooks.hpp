#pragma once

// Optional collaborator notified around every batch of terminal writes, so
// that an unrelated output subsystem does not interleave with the bar.
// Implementations must not throw.
class OutputHooks {
    public:
    virtual ~OutputHooks() = default;

    virtual void pause_output() noexcept = 0;
    virtual void resume_output() noexcept = 0;
};
