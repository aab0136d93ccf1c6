#pragma once

#include "config/iconfig_source.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace flbkinesis {

/**
 * @brief IConfigSource backed by one [[outputs]] table of a TOML file
 *
 * Scalars are rendered as strings (true → "true", 42 → "42") so the
 * same validation path serves host-supplied and file-supplied config.
 * ${VAR} references in string values are expanded from the environment.
 */
class TomlConfigSource : public IConfigSource {
public:
    TomlConfigSource(std::string name, std::unordered_map<std::string, std::string> values);

    [[nodiscard]] std::string get(std::string_view key) const override;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
    std::unordered_map<std::string, std::string> values_;
};

// ============================================================================
// TOML file layout
//
//   [runtime]
//   log_level = "debug"
//   workers = 4
//   task_timeout_ms = 60000
//   shutdown_timeout_ms = 30000
//
//   [[outputs]]
//   name = "app-logs"
//   stream = "my-stream"
//   region = "us-east-1"
// ============================================================================

struct RuntimeSettings {
    std::string log_level;      // empty = keep FLB_LOG_LEVEL / default
    size_t workers = 4;
    std::chrono::milliseconds task_timeout{60000};
    std::chrono::milliseconds shutdown_timeout{30000};
};

struct TomlConfigFile {
    RuntimeSettings runtime;
    std::vector<TomlConfigSource> outputs;

    /**
     * @brief Parse TOML content
     * @throws std::runtime_error on parse failure or unclosed ${...}
     */
    [[nodiscard]] static TomlConfigFile parse_string(const std::string& content);

    /**
     * @brief Parse TOML file
     * @throws std::runtime_error on file I/O or parse failure
     */
    [[nodiscard]] static TomlConfigFile parse_file(const std::string& file_path);
};

} // namespace flbkinesis
