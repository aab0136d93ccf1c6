#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace flbkinesis {

/**
 * @brief Tracks in-flight delivery tasks and gates new ones during exit
 *
 * Every task brackets its work with try_enter_task() / leave_task().
 * Once initiate_shutdown() runs no new task is admitted, and
 * wait_for_drain() blocks until the in-flight count reaches zero or the
 * shutdown timeout expires.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    void initiate_shutdown();

    /// Returns false if shutting down (the caller must not start the task)
    [[nodiscard]] bool try_enter_task();

    void leave_task();

    /// True if drained cleanly, false if the timeout expired first
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::chrono::milliseconds shutdown_timeout() const {
        return config_.shutdown_timeout;
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/// RAII enter/leave for one task; check admitted() before doing work
class TaskGuard {
public:
    explicit TaskGuard(ShutdownCoordinator& coordinator)
        : coordinator_(coordinator), admitted_(coordinator.try_enter_task()) {}

    /// Takes over a task the caller already entered with try_enter_task()
    TaskGuard(ShutdownCoordinator& coordinator, std::adopt_lock_t)
        : coordinator_(coordinator), admitted_(true) {}

    ~TaskGuard() {
        if (admitted_) {
            coordinator_.leave_task();
        }
    }

    TaskGuard(const TaskGuard&) = delete;
    TaskGuard& operator=(const TaskGuard&) = delete;

    [[nodiscard]] bool admitted() const { return admitted_; }

private:
    ShutdownCoordinator& coordinator_;
    bool admitted_;
};

} // namespace flbkinesis
