#pragma once

namespace platform {

// Catches SIGINT, SIGTERM and SIGQUIT for its lifetime and records that one
// arrived instead of terminating. The previous handlers are restored on
// destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // True once any of the signals has been delivered.
    bool triggered() const;

    // Clear the flag (testing, or a second run in one process).
    void reset();

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
