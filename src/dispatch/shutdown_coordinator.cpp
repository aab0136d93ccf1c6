#include "dispatch/shutdown_coordinator.hpp"

namespace flbkinesis {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::initiate_shutdown() {
    {
        std::lock_guard<std::mutex> lock(drain_mutex_);
        shutting_down_.store(true, std::memory_order_release);
    }
    drain_cv_.notify_all();
}

bool ShutdownCoordinator::try_enter_task() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Re-check after the increment; initiate_shutdown() may have raced us
    if (shutting_down_.load(std::memory_order_acquire)) {
        leave_task();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_task() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1) {
        // Lock so the notify cannot fall between the waiter's check and its sleep
        std::lock_guard<std::mutex> lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.shutdown_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace flbkinesis
