#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flbkinesis {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Three-valued flush signal understood by the host.
 *
 * Numeric values match the host protocol (FLB_ERROR / FLB_OK / FLB_RETRY).
 */
enum class FlushOutcome : int {
    ERROR = 0,
    OK = 1,
    RETRY = 2
};

inline constexpr const char* flush_outcome_to_string(FlushOutcome outcome) {
    switch (outcome) {
        case FlushOutcome::OK:    return "OK";
        case FlushOutcome::RETRY: return "RETRY";
        case FlushOutcome::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline constexpr int to_host_code(FlushOutcome outcome) noexcept {
    return static_cast<int>(outcome);
}

// ============================================================================
// Records
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Time value as supplied by the host decoder for one entry.
 *
 * Exactly one source applies: a structured event time, whole epoch
 * seconds, or nothing (the normalizer falls back to wall-clock time).
 */
struct HostTimestamp {
    enum class Kind {
        NONE,
        EVENT_TIME,
        EPOCH_SECONDS
    };

    Kind kind = Kind::NONE;
    Timestamp event_time{};
    uint64_t epoch_seconds = 0;

    static HostTimestamp from_event_time(Timestamp tp) {
        HostTimestamp ts;
        ts.kind = Kind::EVENT_TIME;
        ts.event_time = tp;
        return ts;
    }

    static HostTimestamp from_epoch_seconds(uint64_t seconds) {
        HostTimestamp ts;
        ts.kind = Kind::EPOCH_SECONDS;
        ts.epoch_seconds = seconds;
        return ts;
    }
};

/// One (timestamp, record) pair as produced by a batch decoder
struct DecodedEntry {
    HostTimestamp timestamp;
    nlohmann::json record;      // object, or null when the host sent no map
};

/**
 * @brief A decoded log event with its resolved timestamp.
 *
 * A null record is retained (marked invalid) so bad input stays visible;
 * consumers must check is_null() before use.
 */
struct NormalizedRecord {
    nlohmann::json record;
    Timestamp timestamp{};
    bool valid = true;

    [[nodiscard]] bool is_null() const { return record.is_null(); }
};

/// Output of one normalization pass. records.size() == count.
struct NormalizedBatch {
    std::vector<NormalizedRecord> records;
    size_t count = 0;
    bool all_valid = true;
    bool decode_failed = false;     // decoding stopped on a malformed entry
    std::string decode_error;
};

// ============================================================================
// Delivery Request Buffer
// ============================================================================

/// One entry of a PutRecords request
struct PutRecordsEntry {
    std::string data;
    std::string partition_key;
};

/**
 * @brief Per-flush request buffer.
 *
 * Owned by exactly one flush task; never shared across flushes.
 * payload_bytes tracks data + partition key sizes of all entries.
 */
struct RequestBuffer {
    std::vector<PutRecordsEntry> entries;
    size_t payload_bytes = 0;

    void clear() {
        entries.clear();
        payload_bytes = 0;
    }

    [[nodiscard]] size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
};

} // namespace flbkinesis
