#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flbkinesis {

/// Per-entry outcome, in request order
struct PutRecordsEntryResult {
    std::string sequence_number;
    std::string shard_id;
    std::string error_code;         // empty = accepted
    std::string error_message;

    [[nodiscard]] bool failed() const { return !error_code.empty(); }
};

struct PutRecordsResponse {
    bool transport_ok = false;      // false = no HTTP response at all
    int http_status = 0;
    std::string error_code;         // request-level error (__type suffix)
    std::string error_message;
    uint32_t failed_record_count = 0;
    std::vector<PutRecordsEntryResult> records;

    [[nodiscard]] bool request_ok() const {
        return transport_ok && http_status >= 200 && http_status < 300 && error_code.empty();
    }
};

/**
 * @brief Network boundary to the streaming-ingestion service
 *
 * Must be safe to call from several flush tasks at once.
 */
class IStreamClient {
public:
    virtual ~IStreamClient() = default;

    [[nodiscard]] virtual PutRecordsResponse put_records(
        const std::string& stream, const std::vector<PutRecordsEntry>& entries) = 0;

    /// Human-readable target for logging (e.g. "kinesis:us-east-1/my-stream")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace flbkinesis
