#include "registry/instance_registry.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>
#include <stdexcept>

namespace flbkinesis {

InstanceRegistry::InstanceRegistry(Factory factory)
    : factory_(std::move(factory)) {}

Result<uint32_t> InstanceRegistry::create(const IConfigSource& source) {
    std::unique_lock lock(mutex_);

    const auto id = static_cast<uint32_t>(instances_.size());

    auto loaded = ConfigLoader::load(source, id);
    if (!loaded.success) {
        return Result<uint32_t>::error(ErrorCategory::CONFIGURATION_ERROR,
                                       std::move(loaded.error_message));
    }

    if (!factory_) {
        return Result<uint32_t>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("[kinesis {}] no delivery adapter factory", id));
    }

    auto instance = std::make_shared<PluginInstance>();
    instance->config = std::move(loaded.config);

    try {
        instance->output = factory_(instance->config);
    } catch (const std::exception& e) {
        return Result<uint32_t>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("[kinesis {}] failed to create delivery adapter: {}", id, e.what()));
    }

    if (!instance->output) {
        return Result<uint32_t>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("[kinesis {}] failed to create delivery adapter", id));
    }

    instances_.push_back(std::move(instance));
    utils::log::info(std::format("[kinesis {}] instance registered (stream '{}', region '{}')",
        id, instances_.back()->config.stream, instances_.back()->config.region));
    return Result<uint32_t>::ok(id);
}

std::shared_ptr<const PluginInstance> InstanceRegistry::get(uint32_t id) const {
    std::shared_lock lock(mutex_);
    if (id >= instances_.size()) {
        throw std::out_of_range(std::format("no plugin instance with id {} ({} registered)",
                                            id, instances_.size()));
    }
    return instances_[id];
}

size_t InstanceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return instances_.size();
}

} // namespace flbkinesis
