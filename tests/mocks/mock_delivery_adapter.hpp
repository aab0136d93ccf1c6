#pragma once

#include "delivery/idelivery_adapter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace flbkinesis::testing {

/**
 * @brief Recording delivery adapter with scripted outcomes
 *
 * flush() returns the scripted outcomes in order, then the default.
 * Every add_record() call is recorded with the buffer it was given.
 * While held, flush() blocks on entry until release_flush().
 */
class MockDeliveryAdapter : public IDeliveryAdapter {
public:
    struct AddedRecord {
        const RequestBuffer* buffer;
        nlohmann::json record;
        Timestamp timestamp;
    };

    explicit MockDeliveryAdapter(uint32_t id = 0,
                                 FlushOutcome default_outcome = FlushOutcome::OK)
        : id_(id), default_outcome_(default_outcome) {}

    [[nodiscard]] FlushOutcome add_record(RequestBuffer& buffer, const nlohmann::json& record,
                                          Timestamp timestamp) override {
        if (add_delay_.count() > 0) {
            std::this_thread::sleep_for(add_delay_);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            added_.push_back(AddedRecord{&buffer, record, timestamp});
        }
        buffer.entries.push_back(PutRecordsEntry{record.dump(), "pk"});
        return add_outcome_;
    }

    [[nodiscard]] FlushOutcome flush(RequestBuffer& buffer) override {
        {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            gate_cv_.wait(lock, [this] { return !flush_held_; });
        }
        flush_count_.fetch_add(1, std::memory_order_relaxed);
        if (throw_on_flush_) {
            throw std::runtime_error("adapter failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        flushed_sizes_.push_back(buffer.size());
        if (!script_.empty()) {
            const FlushOutcome outcome = script_.front();
            script_.pop_front();
            return outcome;
        }
        return default_outcome_;
    }

    [[nodiscard]] uint32_t plugin_id() const override { return id_; }

    // ---- Scripting ----

    void script(std::initializer_list<FlushOutcome> outcomes) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.assign(outcomes.begin(), outcomes.end());
    }
    void set_add_outcome(FlushOutcome outcome) { add_outcome_ = outcome; }
    void set_throw_on_flush(bool v) { throw_on_flush_ = v; }
    void set_add_delay(std::chrono::milliseconds delay) { add_delay_ = delay; }

    void hold_flush() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        flush_held_ = true;
    }
    void release_flush() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            flush_held_ = false;
        }
        gate_cv_.notify_all();
    }

    // ---- Inspection ----

    [[nodiscard]] uint64_t flush_count() const {
        return flush_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<AddedRecord> added() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return added_;
    }

    [[nodiscard]] std::vector<size_t> flushed_sizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return flushed_sizes_;
    }

private:
    uint32_t id_;
    FlushOutcome default_outcome_;
    FlushOutcome add_outcome_ = FlushOutcome::OK;
    bool throw_on_flush_ = false;
    std::chrono::milliseconds add_delay_{0};

    mutable std::mutex mutex_;
    std::deque<FlushOutcome> script_;
    std::vector<AddedRecord> added_;
    std::vector<size_t> flushed_sizes_;
    std::atomic<uint64_t> flush_count_{0};

    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool flush_held_ = false;
};

} // namespace flbkinesis::testing
