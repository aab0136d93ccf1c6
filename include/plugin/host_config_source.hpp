#pragma once

#include "config/iconfig_source.hpp"
#include "plugin/plugin_interface.hpp"

#include <string>
#include <string_view>

namespace flbkinesis {

/// IConfigSource reading one output section through the host's config_value callback
class HostConfigSource : public IConfigSource {
public:
    HostConfigSource(const FlbHostApi& api, void* instance)
        : api_(api), instance_(instance) {}

    [[nodiscard]] std::string get(std::string_view key) const override {
        if (!api_.config_value) {
            return {};
        }
        const std::string name(key);
        const char* value = api_.config_value(api_.host, instance_, name.c_str());
        return value ? std::string(value) : std::string{};
    }

private:
    const FlbHostApi& api_;
    void* instance_;
};

} // namespace flbkinesis
