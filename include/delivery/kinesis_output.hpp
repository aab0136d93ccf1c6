#pragma once

#include "config/config_types.hpp"
#include "delivery/backoff.hpp"
#include "delivery/idelivery_adapter.hpp"
#include "delivery/istream_client.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace flbkinesis {

// Kinesis PutRecords limits
inline constexpr size_t kMaximumRecordsPerPut = 500;
inline constexpr size_t kMaximumPutRecordBatchSize = 5 * 1024 * 1024;
inline constexpr size_t kMaximumRecordSize = 1024 * 1024;
inline constexpr size_t kPartitionKeyMaxLength = 256;
inline constexpr size_t kRandomPartitionKeyLength = 8;

/**
 * @brief Delivery adapter for Kinesis Data Streams
 *
 * Turns records into PutRecords entries (data_keys filter, time_key
 * injection, optional trailing newline, partition key) and sends them
 * through an IStreamClient in batches of at most 500 entries / 5 MiB.
 *
 * Stateless per flush apart from the shared throttling backoff and the
 * counters, so concurrent flushes with separate buffers are safe.
 */
class KinesisOutput : public IDeliveryAdapter {
public:
    KinesisOutput(OutputConfig config, std::shared_ptr<IStreamClient> client);
    KinesisOutput(OutputConfig config, std::shared_ptr<IStreamClient> client,
                  const Backoff::Config& backoff);

    // Non-copyable
    KinesisOutput(const KinesisOutput&) = delete;
    KinesisOutput& operator=(const KinesisOutput&) = delete;

    [[nodiscard]] FlushOutcome add_record(RequestBuffer& buffer,
                                          const nlohmann::json& record,
                                          Timestamp timestamp) override;

    [[nodiscard]] FlushOutcome flush(RequestBuffer& buffer) override;

    [[nodiscard]] uint32_t plugin_id() const override { return config_.plugin_id; }

    [[nodiscard]] const OutputConfig& config() const { return config_; }

    /**
     * @brief Build the payload bytes for one record
     * @return nullopt when the record cannot be serialized
     */
    [[nodiscard]] std::optional<std::string> serialize_record(const nlohmann::json& record,
                                                              Timestamp timestamp) const;

    /// Value of the configured partition key field, or a random key
    [[nodiscard]] std::string partition_key_for(const nlohmann::json& record) const;

    struct Stats {
        uint64_t records_added;
        uint64_t records_dropped;       ///< oversized or unserializable
        uint64_t records_sent;
        uint64_t records_failed;        ///< rejected entries in partial failures
        uint64_t requests_sent;
        uint64_t throttled_requests;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    FlushOutcome send_current_batch(RequestBuffer& buffer);
    FlushOutcome handle_response(RequestBuffer& buffer, const PutRecordsResponse& response);

    OutputConfig config_;
    std::shared_ptr<IStreamClient> client_;
    Backoff backoff_;

    std::atomic<uint64_t> records_added_{0};
    std::atomic<uint64_t> records_dropped_{0};
    std::atomic<uint64_t> records_sent_{0};
    std::atomic<uint64_t> records_failed_{0};
    std::atomic<uint64_t> requests_sent_{0};
    std::atomic<uint64_t> throttled_requests_{0};
};

/// True for error codes that signal throttling (retry after backoff)
[[nodiscard]] bool is_throttling_error(const std::string& error_code);

/// True for error codes no retry can fix (missing stream, bad request, denied)
[[nodiscard]] bool is_fatal_error(const std::string& error_code);

} // namespace flbkinesis
