#pragma once

#include "config/iconfig_source.hpp"

#include <string>
#include <unordered_map>

namespace flbkinesis::testing {

/**
 * @brief In-memory config source for one output instance
 */
class MapConfigSource : public IConfigSource {
public:
    MapConfigSource() = default;
    MapConfigSource(std::initializer_list<std::pair<const std::string, std::string>> values)
        : values_(values) {}

    [[nodiscard]] std::string get(std::string_view key) const override {
        const auto it = values_.find(std::string(key));
        return it == values_.end() ? std::string{} : it->second;
    }

    void set(const std::string& key, std::string value) { values_[key] = std::move(value); }

private:
    std::unordered_map<std::string, std::string> values_;
};

} // namespace flbkinesis::testing
