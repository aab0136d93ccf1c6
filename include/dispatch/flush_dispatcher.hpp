#pragma once

#include "core/types.hpp"
#include "dispatch/shutdown_coordinator.hpp"
#include "dispatch/worker_pool.hpp"
#include "registry/instance_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace flbkinesis {

/**
 * @brief Asynchronous, retry-bounded delivery of normalized batches
 *
 * dispatch() hands the batch to a worker and returns OK at once; the
 * host never waits on the network. Each task runs up to max_attempts
 * attempts against the instance's delivery adapter, stopping at the
 * first outcome other than RETRY or when its deadline has passed.
 * Terminal outcomes are logged and counted in Stats.
 */
class FlushDispatcher {
public:
    static constexpr int kDefaultRetries = 2;
    static constexpr size_t kRequestBufferCapacity = 500;

    struct Config {
        int max_attempts = kDefaultRetries;
        std::chrono::milliseconds task_timeout{60000};
        size_t worker_threads = 4;
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    explicit FlushDispatcher(const InstanceRegistry& registry);
    FlushDispatcher(const InstanceRegistry& registry, const Config& config);
    ~FlushDispatcher();

    // Non-copyable
    FlushDispatcher(const FlushDispatcher&) = delete;
    FlushDispatcher& operator=(const FlushDispatcher&) = delete;

    /**
     * @brief Queue delivery of a batch
     * @return OK once queued; RETRY when shutting down (nothing queued)
     */
    [[nodiscard]] FlushOutcome dispatch(uint32_t id, std::string tag, NormalizedBatch batch);

    /**
     * @brief Run the whole retry loop on the calling thread
     *
     * This is the body of a dispatched task. The returned outcome is the
     * terminal one (RETRY means the attempt budget ran out).
     */
    FlushOutcome flush_with_retries(uint32_t id, const std::string& tag,
                                    const NormalizedBatch& batch,
                                    std::chrono::steady_clock::time_point deadline);

    FlushOutcome flush_with_retries(uint32_t id, const std::string& tag,
                                    const NormalizedBatch& batch);

    /// One attempt: fresh buffer, add every non-null record, then flush once
    [[nodiscard]] FlushOutcome run_attempt(uint32_t id, const std::string& tag,
                                           const NormalizedBatch& batch);

    /**
     * @brief Stop intake and wait for in-flight tasks
     * @return true if every task finished within shutdown_timeout
     */
    bool shutdown();

    [[nodiscard]] bool is_shutting_down() const { return coordinator_.is_shutting_down(); }
    [[nodiscard]] uint32_t in_flight() const { return coordinator_.in_flight_count(); }
    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t tasks_dispatched;
        uint64_t tasks_rejected;        ///< refused during shutdown
        uint64_t tasks_succeeded;
        uint64_t tasks_failed;          ///< ERROR, including exceptions
        uint64_t tasks_retry_exhausted;
        uint64_t tasks_timed_out;
        uint64_t attempts_total;
        uint64_t records_skipped_null;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    const InstanceRegistry& registry_;
    Config config_;
    ShutdownCoordinator coordinator_;

    std::atomic<uint64_t> tasks_dispatched_{0};
    std::atomic<uint64_t> tasks_rejected_{0};
    std::atomic<uint64_t> tasks_succeeded_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<uint64_t> tasks_retry_exhausted_{0};
    std::atomic<uint64_t> tasks_timed_out_{0};
    std::atomic<uint64_t> attempts_total_{0};
    std::atomic<uint64_t> records_skipped_null_{0};

    // Last member: workers must stop before the state above is destroyed
    WorkerPool pool_;
};

} // namespace flbkinesis
