#pragma once

#include "config/iconfig_source.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "dispatch/flush_dispatcher.hpp"
#include "ingest/batch_decoder.hpp"
#include "ingest/record_normalizer.hpp"
#include "registry/instance_registry.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace flbkinesis {

/**
 * @brief Plugin lifecycle: register, init, flush, exit
 *
 * Owns the instance registry, the normalizer and the flush dispatcher.
 * The exported C functions forward to one process-wide PluginHost;
 * tests and the replay tool construct their own.
 */
class PluginHost {
public:
    static constexpr const char* kPluginName = "kinesis";
    static constexpr const char* kPluginDescription = "Amazon Kinesis Data Streams Fluent Bit Plugin.";

    /// Host registration callback; returns 0 on success
    using RegisterFn = std::function<int(const char* name, const char* description)>;

    explicit PluginHost(InstanceRegistry::Factory factory);
    PluginHost(InstanceRegistry::Factory factory, const FlushDispatcher::Config& dispatch_config);

    // Non-copyable
    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    /**
     * @brief Announce name and description to the host
     *
     * Only the first call reaches the host; later calls return the
     * cached status. OK when the host accepted, ERROR otherwise.
     */
    FlushOutcome on_register(const RegisterFn& register_fn);

    /**
     * @brief Configure logging (first call only) and create an instance
     * @return The new instance identifier, or the configuration error
     */
    [[nodiscard]] Result<uint32_t> on_init(const IConfigSource& source);

    /**
     * @brief Normalize the batch and queue its delivery
     *
     * OK once queued. ERROR for an unknown identifier or a chunk from
     * which not a single entry could be decoded. RETRY while exiting.
     */
    [[nodiscard]] FlushOutcome on_flush(uint32_t id, IBatchDecoder& decoder, const std::string& tag);

    /// Stop intake, wait for in-flight deliveries; always OK
    FlushOutcome on_exit();

    /**
     * @brief Apply the log level once per host (later calls are no-ops)
     * @param level Explicit level; nullopt reads FLB_LOG_LEVEL
     */
    void configure_logging(std::optional<utils::log::Level> level = std::nullopt);

    [[nodiscard]] InstanceRegistry& registry() { return registry_; }
    [[nodiscard]] FlushDispatcher& dispatcher() { return dispatcher_; }

    /// Production adapter: KinesisOutput over HttpStreamClient
    [[nodiscard]] static InstanceRegistry::Factory default_factory();

private:
    InstanceRegistry registry_;
    RecordNormalizer normalizer_;
    FlushDispatcher dispatcher_;

    std::once_flag register_once_;
    FlushOutcome register_status_ = FlushOutcome::ERROR;
    std::once_flag logging_once_;
};

} // namespace flbkinesis
