#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace flbkinesis {

/**
 * @brief Fixed-size pool of std::jthread workers over a FIFO task queue
 *
 * submit() is non-blocking. shutdown() stops intake, lets the workers
 * finish every queued task and joins them; it is idempotent and also
 * runs from the destructor.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads = 4);
    ~WorkerPool();

    // Non-copyable, non-movable (workers capture this)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task; false once shutdown() has been called
    [[nodiscard]] bool submit(Task task);

    void shutdown();

    [[nodiscard]] size_t thread_count() const { return workers_.size(); }
    [[nodiscard]] size_t queued() const;
    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    struct Stats {
        uint64_t submitted;
        uint64_t completed;
        uint64_t rejected;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::atomic<bool> running_{true};
    std::vector<std::jthread> workers_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace flbkinesis
