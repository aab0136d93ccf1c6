#include "config/toml_config_source.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace flbkinesis {

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

/// Render a scalar node as the string a host would hand us; false for non-scalars
bool scalar_to_string(const toml::node& node, std::string& out) {
    if (const auto* s = node.as_string()) {
        out = expand_env_vars(s->get());
        return true;
    }
    if (const auto* b = node.as_boolean()) {
        out = b->get() ? "true" : "false";
        return true;
    }
    if (const auto* i = node.as_integer()) {
        out = std::to_string(i->get());
        return true;
    }
    if (const auto* f = node.as_floating_point()) {
        out = std::format("{}", f->get());
        return true;
    }
    return false;
}

RuntimeSettings extract_runtime(const toml::table& root) {
    RuntimeSettings cfg;
    const auto* runtime = root["runtime"].as_table();
    if (!runtime) return cfg;
    const auto& r = *runtime;

    cfg.log_level = expand_env_vars(r["log_level"].value_or(""s));
    cfg.workers = static_cast<size_t>(r["workers"].value_or(4));
    cfg.task_timeout = std::chrono::milliseconds(r["task_timeout_ms"].value_or(60000));
    cfg.shutdown_timeout = std::chrono::milliseconds(r["shutdown_timeout_ms"].value_or(30000));

    if (cfg.workers == 0) {
        throw std::runtime_error("[runtime] workers must be at least 1");
    }
    return cfg;
}

std::vector<TomlConfigSource> extract_outputs(const toml::table& root) {
    std::vector<TomlConfigSource> result;
    const auto* arr = root["outputs"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            throw std::runtime_error(std::format("outputs[{}] is not a table", index));
        }

        std::unordered_map<std::string, std::string> values;
        for (const auto& [key, val] : *tbl) {
            std::string rendered;
            if (scalar_to_string(val, rendered)) {
                values.emplace(std::string(key.str()), std::move(rendered));
            } else {
                utils::log::warn(std::format("outputs[{}].{}: non-scalar value ignored",
                                             index, key.str()));
            }
        }

        std::string name = std::format("outputs[{}]", index);
        if (const auto it = values.find("name"); it != values.end() && !it->second.empty()) {
            name = it->second;
        }
        result.emplace_back(std::move(name), std::move(values));
        ++index;
    }
    return result;
}

TomlConfigFile from_table(const toml::table& root) {
    TomlConfigFile file;
    file.runtime = extract_runtime(root);
    file.outputs = extract_outputs(root);
    return file;
}

} // anonymous namespace

// ============================================================================
// TomlConfigSource
// ============================================================================

TomlConfigSource::TomlConfigSource(std::string name,
                                   std::unordered_map<std::string, std::string> values)
    : name_(std::move(name)), values_(std::move(values)) {}

std::string TomlConfigSource::get(std::string_view key) const {
    const auto it = values_.find(std::string(key));
    return it != values_.end() ? it->second : std::string{};
}

// ============================================================================
// TomlConfigFile
// ============================================================================

TomlConfigFile TomlConfigFile::parse_string(const std::string& content) {
    try {
        return from_table(toml::parse(content));
    } catch (const toml::parse_error& e) {
        throw std::runtime_error(std::format("TOML parse error: {}", e.description()));
    }
}

TomlConfigFile TomlConfigFile::parse_file(const std::string& file_path) {
    try {
        return from_table(toml::parse_file(file_path));
    } catch (const toml::parse_error& e) {
        throw std::runtime_error(std::format("TOML parse error in {}: {}",
                                             file_path, e.description()));
    }
}

} // namespace flbkinesis
