#pragma once

#include <string>
#include <string_view>

namespace flbkinesis {

/**
 * @brief Abstract key/value config source
 *
 * One source describes one output instance. Backends: the host runtime
 * (HostConfigSource), a TOML file (TomlConfigSource), or in-memory for tests.
 */
class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    /// Value for key, or empty string when unset
    [[nodiscard]] virtual std::string get(std::string_view key) const = 0;
};

} // namespace flbkinesis
