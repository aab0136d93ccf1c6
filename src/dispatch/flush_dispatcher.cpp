#include "dispatch/flush_dispatcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace flbkinesis {

FlushDispatcher::FlushDispatcher(const InstanceRegistry& registry)
    : FlushDispatcher(registry, Config{}) {}

FlushDispatcher::FlushDispatcher(const InstanceRegistry& registry, const Config& config)
    : registry_(registry),
      config_(config),
      coordinator_(ShutdownCoordinator::Config{.shutdown_timeout = config.shutdown_timeout}),
      pool_(config.worker_threads) {
    if (config_.max_attempts < 1) {
        config_.max_attempts = 1;
    }
}

FlushDispatcher::~FlushDispatcher() {
    coordinator_.initiate_shutdown();
    pool_.shutdown();
}

// ============================================================================
// Dispatch
// ============================================================================

FlushOutcome FlushDispatcher::dispatch(uint32_t id, std::string tag, NormalizedBatch batch) {
    if (!coordinator_.try_enter_task()) {
        tasks_rejected_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("[kinesis {}] shutting down, flush for tag '{}' not accepted",
                                     id, tag));
        return FlushOutcome::RETRY;
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.task_timeout;
    const size_t count = batch.count;

    const bool queued = pool_.submit(
        [this, id, tag, batch = std::move(batch), deadline] {
            TaskGuard guard(coordinator_, std::adopt_lock);
            (void)flush_with_retries(id, tag, batch, deadline);
        });

    if (!queued) {
        coordinator_.leave_task();
        tasks_rejected_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("[kinesis {}] worker pool stopped, flush for tag '{}' not accepted",
                                     id, tag));
        return FlushOutcome::RETRY;
    }

    tasks_dispatched_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("[kinesis {}] queued flush of {} records for tag '{}'",
                                  id, count, tag));
    return FlushOutcome::OK;
}

// ============================================================================
// Task body
// ============================================================================

FlushOutcome FlushDispatcher::flush_with_retries(uint32_t id, const std::string& tag,
                                                 const NormalizedBatch& batch) {
    return flush_with_retries(id, tag, batch,
                              std::chrono::steady_clock::now() + config_.task_timeout);
}

FlushOutcome FlushDispatcher::flush_with_retries(uint32_t id, const std::string& tag,
                                                 const NormalizedBatch& batch,
                                                 std::chrono::steady_clock::time_point deadline) {
    for (const auto& record : batch.records) {
        if (record.is_null()) {
            records_skipped_null_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    FlushOutcome outcome = FlushOutcome::RETRY;
    int attempts = 0;
    bool timed_out = false;

    try {
        while (attempts < config_.max_attempts) {
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }

            ++attempts;
            attempts_total_.fetch_add(1, std::memory_order_relaxed);
            outcome = run_attempt(id, tag, batch);
            if (outcome != FlushOutcome::RETRY) {
                break;
            }
            utils::log::debug(std::format("[kinesis {}] attempt {}/{} for tag '{}' returned RETRY",
                                          id, attempts, config_.max_attempts, tag));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("[kinesis {}] flush for tag '{}' failed with exception: {}",
                                      id, tag, e.what()));
        tasks_failed_.fetch_add(1, std::memory_order_relaxed);
        return FlushOutcome::ERROR;
    }

    if (timed_out) {
        tasks_timed_out_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format(
            "[kinesis {}] flush of {} records for tag '{}' abandoned: deadline passed after {} attempt(s)",
            id, batch.count, tag, attempts));
        return FlushOutcome::ERROR;
    }

    switch (outcome) {
        case FlushOutcome::OK:
            tasks_succeeded_.fetch_add(1, std::memory_order_relaxed);
            utils::log::info(std::format("[kinesis {}] flushed {} records for tag '{}' ({} attempt(s))",
                                         id, batch.count, tag, attempts));
            break;
        case FlushOutcome::RETRY:
            tasks_retry_exhausted_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format(
                "[kinesis {}] giving up on {} records for tag '{}' after {} attempts",
                id, batch.count, tag, attempts));
            break;
        case FlushOutcome::ERROR:
            tasks_failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("[kinesis {}] flush of {} records for tag '{}' failed",
                                          id, batch.count, tag));
            break;
    }
    return outcome;
}

FlushOutcome FlushDispatcher::run_attempt(uint32_t id, const std::string& tag,
                                          const NormalizedBatch& batch) {
    const auto instance = registry_.get(id);
    IDeliveryAdapter& output = *instance->output;

    RequestBuffer buffer;
    buffer.entries.reserve(kRequestBufferCapacity);

    const bool trace = utils::log::enabled(utils::log::Level::INFO);

    for (size_t i = 0; i < batch.records.size(); ++i) {
        const NormalizedRecord& rec = batch.records[i];

        if (trace) {
            utils::log::info(std::format("[kinesis {}] [{}] record {} @ {}: {}",
                id, tag, i, utils::format_timestamp_utc(rec.timestamp),
                rec.record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
        }

        if (rec.is_null()) {
            utils::log::debug(std::format("[kinesis {}] [{}] skipping null record {}", id, tag, i));
            continue;
        }

        const FlushOutcome added = output.add_record(buffer, rec.record, rec.timestamp);
        if (added != FlushOutcome::OK) {
            return added;
        }
    }

    return output.flush(buffer);
}

// ============================================================================
// Shutdown
// ============================================================================

bool FlushDispatcher::shutdown() {
    coordinator_.initiate_shutdown();

    const uint32_t pending = coordinator_.in_flight_count();
    if (pending > 0) {
        utils::log::info(std::format("[kinesis] waiting up to {}ms for {} in-flight flush task(s)",
                                     config_.shutdown_timeout.count(), pending));
    }

    if (!coordinator_.wait_for_drain()) {
        utils::log::warn(std::format("[kinesis] {} flush task(s) still running after {}ms",
                                     coordinator_.in_flight_count(),
                                     config_.shutdown_timeout.count()));
        return false;
    }

    pool_.shutdown();
    return true;
}

FlushDispatcher::Stats FlushDispatcher::get_stats() const {
    return Stats{
        .tasks_dispatched = tasks_dispatched_.load(std::memory_order_relaxed),
        .tasks_rejected = tasks_rejected_.load(std::memory_order_relaxed),
        .tasks_succeeded = tasks_succeeded_.load(std::memory_order_relaxed),
        .tasks_failed = tasks_failed_.load(std::memory_order_relaxed),
        .tasks_retry_exhausted = tasks_retry_exhausted_.load(std::memory_order_relaxed),
        .tasks_timed_out = tasks_timed_out_.load(std::memory_order_relaxed),
        .attempts_total = attempts_total_.load(std::memory_order_relaxed),
        .records_skipped_null = records_skipped_null_.load(std::memory_order_relaxed),
    };
}

} // namespace flbkinesis
