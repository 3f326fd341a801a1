#include "installer/cancel_signal.hpp"

namespace installer {

void CancelSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (notified_) {
            return;
        }
        notified_ = true;
    }
    cv_.notify_all();
}

bool CancelSignal::isNotified() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notified_;
}

bool CancelSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return notified_; });
}

void CancelSignal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return notified_; });
}

} // namespace installer
