#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace installer {

// Single-fire broadcast notification. Any number of threads may wait on it;
// notify() after the first call has no further effect.
class CancelSignal {
public:
    void notify();

    [[nodiscard]] bool isNotified() const;

    // Returns true if the signal fired before the timeout elapsed.
    bool waitFor(std::chrono::milliseconds timeout) const;

    void wait() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool notified_{false};
};

using CancelSignalPtr = std::shared_ptr<CancelSignal>;

} // namespace installer
