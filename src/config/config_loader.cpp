#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <format>

namespace flbkinesis {

// ---- Helpers ---------------------------------------------------------------

bool ConfigLoader::parse_bool(const std::string& value) {
    return utils::to_lower(utils::trim(value)) == "true";
}

std::vector<std::string> ConfigLoader::parse_key_list(const std::string& value) {
    std::vector<std::string> keys;
    for (const auto& token : utils::split(value, ',')) {
        auto key = utils::trim(token);
        if (!key.empty()) {
            keys.emplace_back(std::move(key));
        }
    }
    return keys;
}

// ---- Load + validate -------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load(const IConfigSource& source, const uint32_t plugin_id) {
    namespace keys = config_keys;

    auto read = [&](const char* key, bool quoted = true) {
        std::string value = source.get(key);
        if (quoted) {
            utils::log::info(std::format("[kinesis {}] plugin parameter {} = '{}'", plugin_id, key, value));
        } else {
            utils::log::info(std::format("[kinesis {}] plugin parameter {} = {}", plugin_id, key, value));
        }
        return value;
    };

    const std::string stream = read(keys::kStream);
    const std::string region = read(keys::kRegion);
    const std::string data_keys = read(keys::kDataKeys);
    const std::string partition_key = read(keys::kPartitionKey);
    const std::string role_arn = read(keys::kRoleArn);
    const std::string endpoint = read(keys::kEndpoint);
    const std::string append_newline = read(keys::kAppendNewline, false);
    const std::string time_key = read(keys::kTimeKey);
    const std::string time_key_format = read(keys::kTimeKeyFormat);

    if (stream.empty() || region.empty()) {
        return LoadResult::error(std::format(
            "[kinesis {}] stream and region are required configuration parameters", plugin_id));
    }

    if (partition_key == kReservedPartitionKey) {
        return LoadResult::error(std::format(
            "[kinesis {}] '{}' cannot be set as the partition key", plugin_id, kReservedPartitionKey));
    }

    if (partition_key.empty()) {
        utils::log::info(std::format(
            "[kinesis {}] no partition key provided. A random one will be generated.", plugin_id));
    }

    OutputConfig cfg;
    cfg.plugin_id = plugin_id;
    cfg.stream = stream;
    cfg.region = region;
    cfg.data_keys = parse_key_list(data_keys);
    cfg.partition_key = partition_key;
    cfg.role_arn = role_arn;
    cfg.endpoint = endpoint;
    cfg.append_newline = parse_bool(append_newline);

    if (!time_key.empty()) {
        cfg.time_key = time_key;
        if (!time_key_format.empty()) {
            cfg.time_key_format = time_key_format;
        }
    } else if (!time_key_format.empty()) {
        utils::log::warn(std::format(
            "[kinesis {}] time_key_format is set without time_key; ignoring it", plugin_id));
    }

    return LoadResult::ok(std::move(cfg));
}

} // namespace flbkinesis
