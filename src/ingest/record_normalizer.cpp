#include "ingest/record_normalizer.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>

namespace flbkinesis {

namespace {

// Largest whole-second offset a Timestamp can hold
const uint64_t kMaxEpochSeconds = static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count());

} // anonymous namespace

RecordNormalizer::RecordNormalizer()
    : clock_([] { return std::chrono::system_clock::now(); }) {}

RecordNormalizer::RecordNormalizer(Clock clock)
    : clock_(std::move(clock)) {}

Timestamp RecordNormalizer::resolve_timestamp(const HostTimestamp& ts) const {
    switch (ts.kind) {
        case HostTimestamp::Kind::EVENT_TIME:
            return ts.event_time;
        case HostTimestamp::Kind::EPOCH_SECONDS:
            if (ts.epoch_seconds <= kMaxEpochSeconds) {
                return Timestamp(std::chrono::seconds(static_cast<int64_t>(ts.epoch_seconds)));
            }
            utils::log::warn(std::format("unpack: epoch seconds {} out of range, using current time",
                                         ts.epoch_seconds));
            break;
        case HostTimestamp::Kind::NONE:
            break;
    }
    return clock_();
}

bool RecordNormalizer::probe_serializable(const nlohmann::json& record, std::string& error) {
    try {
        const std::string data = record.dump();
        if (data.empty()) {
            error = "record has zero length";
            return false;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = std::format("serialization error: {}", e.what());
        return false;
    }
}

NormalizedBatch RecordNormalizer::normalize(IBatchDecoder& decoder) const {
    NormalizedBatch batch;
    DecodedEntry entry;

    while (true) {
        const DecodeStatus status = decoder.next(entry);
        if (status == DecodeStatus::END_OF_BATCH) {
            break;
        }
        if (status == DecodeStatus::MALFORMED) {
            batch.decode_failed = true;
            batch.decode_error = decoder.last_error();
            utils::log::warn(std::format("unpack: batch truncated after {} records: {}",
                                         batch.count, batch.decode_error));
            break;
        }

        NormalizedRecord normalized;
        normalized.timestamp = resolve_timestamp(entry.timestamp);
        normalized.record = std::move(entry.record);

        if (normalized.is_null()) {
            utils::log::info(std::format("unpack: record {} is null", batch.count));
            normalized.valid = false;
        } else {
            std::string error;
            if (!probe_serializable(normalized.record, error)) {
                utils::log::info(std::format("unpack: record {} is invalid: {}", batch.count, error));
                normalized.valid = false;
            }
        }

        if (!normalized.valid) {
            batch.all_valid = false;
        }

        batch.records.push_back(std::move(normalized));
        ++batch.count;
        entry = DecodedEntry{};
    }

    utils::log::info(std::format("unpack: processed {} records (all_valid={})",
                                 batch.count, utils::booltostr(batch.all_valid)));
    return batch;
}

} // namespace flbkinesis
