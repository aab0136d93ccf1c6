#include "delivery/kinesis_output.hpp"
#include "delivery/time_format.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace flbkinesis {

namespace {

constexpr std::array<std::string_view, 4> kThrottlingErrors = {
    "ProvisionedThroughputExceededException",
    "ThrottlingException",
    "LimitExceededException",
    "KMSThrottlingException",
};

constexpr std::array<std::string_view, 4> kFatalErrors = {
    "ResourceNotFoundException",
    "ValidationException",
    "InvalidArgumentException",
    "AccessDeniedException",
};

constexpr std::string_view kNestedKeySeparator = "->";

/// msgpack bin/ext values arrive as JSON binary; Kinesis consumers expect text
void binary_to_string(nlohmann::json& value) {
    if (value.is_binary()) {
        const auto& bytes = value.get_binary();
        value = std::string(bytes.begin(), bytes.end());
    } else if (value.is_object() || value.is_array()) {
        for (auto& child : value) {
            binary_to_string(child);
        }
    }
}

} // anonymous namespace

bool is_throttling_error(const std::string& error_code) {
    return std::find(kThrottlingErrors.begin(), kThrottlingErrors.end(), error_code)
        != kThrottlingErrors.end();
}

bool is_fatal_error(const std::string& error_code) {
    return std::find(kFatalErrors.begin(), kFatalErrors.end(), error_code)
        != kFatalErrors.end();
}

// ============================================================================
// Construction
// ============================================================================

KinesisOutput::KinesisOutput(OutputConfig config, std::shared_ptr<IStreamClient> client)
    : KinesisOutput(std::move(config), std::move(client), Backoff::Config{}) {}

KinesisOutput::KinesisOutput(OutputConfig config, std::shared_ptr<IStreamClient> client,
                             const Backoff::Config& backoff)
    : config_(std::move(config)),
      client_(std::move(client)),
      backoff_(backoff) {
    utils::log::info(std::format("[kinesis {}] output ready: {}",
        config_.plugin_id, client_ ? client_->name() : "<no client>"));
}

// ============================================================================
// Record conversion
// ============================================================================

std::optional<std::string> KinesisOutput::serialize_record(const nlohmann::json& record,
                                                           Timestamp timestamp) const {
    nlohmann::json out = record;
    binary_to_string(out);

    if (!config_.time_key.empty()) {
        out[config_.time_key] = format_time(timestamp, config_.time_key_format);
    }

    if (!config_.data_keys.empty()) {
        nlohmann::json filtered = nlohmann::json::object();
        for (const auto& key : config_.data_keys) {
            if (const auto it = out.find(key); it != out.end()) {
                filtered[key] = std::move(*it);
            }
        }
        out = std::move(filtered);
    }

    std::string data;
    try {
        data = out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        utils::log::error(std::format("[kinesis {}] failed to serialize record: {}",
                                      config_.plugin_id, e.what()));
        return std::nullopt;
    }

    if (config_.append_newline) {
        data += '\n';
    }
    return data;
}

std::string KinesisOutput::partition_key_for(const nlohmann::json& record) const {
    if (config_.partition_key.empty()) {
        return utils::random_alnum(kRandomPartitionKeyLength);
    }

    const nlohmann::json* node = &record;
    for (const auto& part : utils::split(config_.partition_key, kNestedKeySeparator)) {
        if (!node->is_object()) {
            node = nullptr;
            break;
        }
        const auto it = node->find(part);
        if (it == node->end()) {
            node = nullptr;
            break;
        }
        node = &*it;
    }

    std::string key;
    if (node && node->is_string()) {
        key = node->get<std::string>();
    } else if (node && node->is_number()) {
        key = node->dump();
    }

    if (key.empty()) {
        utils::log::debug(std::format("[kinesis {}] partition key '{}' not found in record, using a random key",
                                      config_.plugin_id, config_.partition_key));
        return utils::random_alnum(kRandomPartitionKeyLength);
    }

    if (key.size() > kPartitionKeyMaxLength) {
        key.resize(kPartitionKeyMaxLength);
    }
    return key;
}

// ============================================================================
// IDeliveryAdapter
// ============================================================================

FlushOutcome KinesisOutput::add_record(RequestBuffer& buffer, const nlohmann::json& record,
                                       Timestamp timestamp) {
    auto data = serialize_record(record, timestamp);
    if (!data) {
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
        return FlushOutcome::OK;
    }

    std::string partition_key = partition_key_for(record);
    const size_t entry_size = data->size() + partition_key.size();

    if (entry_size > kMaximumRecordSize) {
        utils::log::warn(std::format(
            "[kinesis {}] Found record with {} bytes, which exceeds the max record size of {} bytes; discarding it",
            config_.plugin_id, entry_size, kMaximumRecordSize));
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
        return FlushOutcome::OK;
    }

    if (buffer.size() >= kMaximumRecordsPerPut ||
        buffer.payload_bytes + entry_size > kMaximumPutRecordBatchSize) {
        const FlushOutcome outcome = send_current_batch(buffer);
        if (outcome != FlushOutcome::OK) {
            return outcome;
        }
    }

    buffer.entries.push_back(PutRecordsEntry{std::move(*data), std::move(partition_key)});
    buffer.payload_bytes += entry_size;
    records_added_.fetch_add(1, std::memory_order_relaxed);
    return FlushOutcome::OK;
}

FlushOutcome KinesisOutput::flush(RequestBuffer& buffer) {
    if (buffer.empty()) {
        return FlushOutcome::OK;
    }
    return send_current_batch(buffer);
}

// ============================================================================
// Sending
// ============================================================================

FlushOutcome KinesisOutput::send_current_batch(RequestBuffer& buffer) {
    if (!client_) {
        utils::log::error(std::format("[kinesis {}] no stream client configured", config_.plugin_id));
        return FlushOutcome::ERROR;
    }

    backoff_.wait();

    requests_sent_.fetch_add(1, std::memory_order_relaxed);
    const PutRecordsResponse response = client_->put_records(config_.stream, buffer.entries);
    return handle_response(buffer, response);
}

FlushOutcome KinesisOutput::handle_response(RequestBuffer& buffer, const PutRecordsResponse& response) {
    const uint32_t id = config_.plugin_id;

    if (!response.transport_ok) {
        utils::log::error(std::format("[kinesis {}] PutRecords to stream '{}' failed: {}",
            id, config_.stream, response.error_message));
        return FlushOutcome::RETRY;
    }

    if (!response.request_ok()) {
        if (is_throttling_error(response.error_code)) {
            throttled_requests_.fetch_add(1, std::memory_order_relaxed);
            backoff_.start();
            utils::log::warn(std::format("[kinesis {}] PutRecords throttled ({}), backing off {}ms",
                id, response.error_code, backoff_.current_delay().count()));
            return FlushOutcome::RETRY;
        }

        const bool client_error = response.http_status >= 400 && response.http_status < 500;
        if (is_fatal_error(response.error_code) || client_error) {
            utils::log::error(std::format("[kinesis {}] PutRecords rejected (HTTP {}, {}): {}",
                id, response.http_status, response.error_code, response.error_message));
            return FlushOutcome::ERROR;
        }

        utils::log::error(std::format("[kinesis {}] PutRecords failed (HTTP {}, {}): {}",
            id, response.http_status, response.error_code, response.error_message));
        return FlushOutcome::RETRY;
    }

    if (response.failed_record_count > 0) {
        const size_t total = buffer.entries.size();
        std::vector<PutRecordsEntry> failed;
        size_t failed_bytes = 0;
        bool throttled = false;

        if (response.records.size() == buffer.entries.size()) {
            for (size_t i = 0; i < response.records.size(); ++i) {
                if (!response.records[i].failed()) continue;
                throttled = throttled || is_throttling_error(response.records[i].error_code);
                failed_bytes += buffer.entries[i].data.size() + buffer.entries[i].partition_key.size();
                failed.push_back(std::move(buffer.entries[i]));
            }
        } else {
            // Cannot correlate results with entries; keep everything
            failed = std::move(buffer.entries);
            failed_bytes = buffer.payload_bytes;
        }

        records_sent_.fetch_add(total - failed.size(), std::memory_order_relaxed);
        records_failed_.fetch_add(failed.size(), std::memory_order_relaxed);
        if (throttled) {
            throttled_requests_.fetch_add(1, std::memory_order_relaxed);
            backoff_.start();
        }

        utils::log::warn(std::format("[kinesis {}] {}/{} records failed to be delivered to stream '{}'",
            id, response.failed_record_count, total, config_.stream));

        // Only the rejected entries remain, for a caller that retries with this buffer
        buffer.entries = std::move(failed);
        buffer.payload_bytes = failed_bytes;
        return FlushOutcome::RETRY;
    }

    records_sent_.fetch_add(buffer.entries.size(), std::memory_order_relaxed);
    utils::log::debug(std::format("[kinesis {}] sent {} records to stream '{}'",
        id, buffer.entries.size(), config_.stream));
    buffer.clear();
    backoff_.reset();
    return FlushOutcome::OK;
}

KinesisOutput::Stats KinesisOutput::get_stats() const {
    return Stats{
        .records_added = records_added_.load(std::memory_order_relaxed),
        .records_dropped = records_dropped_.load(std::memory_order_relaxed),
        .records_sent = records_sent_.load(std::memory_order_relaxed),
        .records_failed = records_failed_.load(std::memory_order_relaxed),
        .requests_sent = requests_sent_.load(std::memory_order_relaxed),
        .throttled_requests = throttled_requests_.load(std::memory_order_relaxed),
    };
}

} // namespace flbkinesis
