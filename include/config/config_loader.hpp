#pragma once

#include "config/config_types.hpp"
#include "config/iconfig_source.hpp"

#include <cstdint>
#include <string>

namespace flbkinesis {

// ============================================================================
// ConfigLoader - Extract and validate OutputConfig from a config source
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        OutputConfig config;

        static LoadResult ok(OutputConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Read every recognized option and validate the combination
     *
     * Logs each parameter value as "[kinesis <id>] plugin parameter ...".
     * Fails when stream or region is missing, when partition_key is the
     * reserved "log", or when endpoint is not an http(s) URL.
     *
     * @param source Config source for this instance
     * @param plugin_id Identifier used for log correlation
     */
    [[nodiscard]] static LoadResult load(const IConfigSource& source, uint32_t plugin_id);

    /// Case-insensitive "true" → true; anything else → false
    [[nodiscard]] static bool parse_bool(const std::string& value);

    /// "a, b,,c" → {"a", "b", "c"}
    [[nodiscard]] static std::vector<std::string> parse_key_list(const std::string& value);
};

} // namespace flbkinesis
