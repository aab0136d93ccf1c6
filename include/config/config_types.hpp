#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flbkinesis {

// ============================================================================
// Recognized option keys
// ============================================================================

namespace config_keys {
    inline constexpr const char* kStream = "stream";
    inline constexpr const char* kRegion = "region";
    inline constexpr const char* kDataKeys = "data_keys";
    inline constexpr const char* kPartitionKey = "partition_key";
    inline constexpr const char* kRoleArn = "role_arn";
    inline constexpr const char* kEndpoint = "endpoint";
    inline constexpr const char* kAppendNewline = "append_newline";
    inline constexpr const char* kTimeKey = "time_key";
    inline constexpr const char* kTimeKeyFormat = "time_key_format";
} // namespace config_keys

inline constexpr const char* kDefaultTimeKeyFormat = "%Y-%m-%dT%H:%M:%S";

// Reserved: the "log" field is the payload itself in most pipelines
inline constexpr const char* kReservedPartitionKey = "log";

// ============================================================================
// OutputConfig - validated, immutable per-instance configuration
// ============================================================================

struct OutputConfig {
    uint32_t plugin_id = 0;

    std::string stream;
    std::string region;
    std::vector<std::string> data_keys;     // empty = forward every key
    std::string partition_key;              // empty = random key per record
    std::string role_arn;
    std::string endpoint;                   // empty = regional default
    std::string time_key;                   // empty = no timestamp injection
    std::string time_key_format = kDefaultTimeKeyFormat;
    bool append_newline = false;
};

} // namespace flbkinesis
