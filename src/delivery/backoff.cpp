#include "delivery/backoff.hpp"

#include <algorithm>
#include <thread>

namespace flbkinesis {

Backoff::Backoff() = default;

Backoff::Backoff(const Config& config)
    : config_(config) {}

void Backoff::start() {
    std::lock_guard lock(mutex_);
    delay_ = (delay_.count() == 0) ? config_.initial : std::min(delay_ * 2, config_.max);
    ready_at_ = std::chrono::steady_clock::now() + delay_;
}

void Backoff::reset() {
    std::lock_guard lock(mutex_);
    delay_ = std::chrono::milliseconds{0};
    ready_at_ = {};
}

void Backoff::wait() const {
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard lock(mutex_);
        deadline = ready_at_;
    }
    if (deadline > std::chrono::steady_clock::now()) {
        std::this_thread::sleep_until(deadline);
    }
}

std::chrono::milliseconds Backoff::current_delay() const {
    std::lock_guard lock(mutex_);
    return delay_;
}

} // namespace flbkinesis
