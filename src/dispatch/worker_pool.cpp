#include "dispatch/worker_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace flbkinesis {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(task));
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

WorkerPool::Stats WorkerPool::get_stats() const {
    return Stats{
        .submitted = submitted_.load(std::memory_order_relaxed),
        .completed = completed_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
    };
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load(std::memory_order_acquire);
            });

            // Drain the queue before exiting
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            utils::log::error(std::format("worker task threw: {}", e.what()));
        }
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace flbkinesis
