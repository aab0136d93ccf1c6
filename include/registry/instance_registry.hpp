#pragma once

#include "config/config_types.hpp"
#include "config/iconfig_source.hpp"
#include "core/error.hpp"
#include "delivery/idelivery_adapter.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace flbkinesis {

/**
 * @brief One configured output instance
 *
 * Immutable once registered; the adapter is shared with in-flight tasks.
 */
struct PluginInstance {
    OutputConfig config;
    std::shared_ptr<IDeliveryAdapter> output;
};

/**
 * @brief Ordered, append-only collection of output instances
 *
 * The identifier of an instance is its position: 0, 1, 2, ...
 * Identifiers are never reused and instances are never removed.
 *
 * Thread-safety: create() holds the unique lock across validation,
 * construction and append so identifiers follow call order; get() and
 * size() take the shared lock.
 */
class InstanceRegistry {
public:
    /// Builds the delivery adapter for a validated configuration (may throw)
    using Factory = std::function<std::shared_ptr<IDeliveryAdapter>(const OutputConfig&)>;

    explicit InstanceRegistry(Factory factory);

    // Non-copyable
    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    /**
     * @brief Validate, construct and append a new instance
     * @return The new identifier, or CONFIGURATION_ERROR (registry unchanged)
     */
    [[nodiscard]] Result<uint32_t> create(const IConfigSource& source);

    /**
     * @brief Instance for an identifier issued by create()
     * @throws std::out_of_range for an identifier that was never issued
     */
    [[nodiscard]] std::shared_ptr<const PluginInstance> get(uint32_t id) const;

    [[nodiscard]] size_t size() const;

private:
    Factory factory_;
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<const PluginInstance>> instances_;
};

} // namespace flbkinesis
