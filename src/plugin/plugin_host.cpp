#include "plugin/plugin_host.hpp"
#include "core/utils.hpp"
#include "delivery/credentials_provider.hpp"
#include "delivery/http_stream_client.hpp"
#include "delivery/kinesis_output.hpp"

#include <format>

namespace flbkinesis {

PluginHost::PluginHost(InstanceRegistry::Factory factory)
    : PluginHost(std::move(factory), FlushDispatcher::Config{}) {}

PluginHost::PluginHost(InstanceRegistry::Factory factory,
                       const FlushDispatcher::Config& dispatch_config)
    : registry_(std::move(factory)),
      dispatcher_(registry_, dispatch_config) {}

InstanceRegistry::Factory PluginHost::default_factory() {
    return [](const OutputConfig& config) -> std::shared_ptr<IDeliveryAdapter> {
        auto credentials = make_credentials_provider(config.role_arn, config.region);
        auto client = std::make_shared<HttpStreamClient>(
            HttpStreamClient::Config{.region = config.region, .endpoint = config.endpoint},
            std::move(credentials));
        return std::make_shared<KinesisOutput>(config, std::move(client));
    };
}

// ============================================================================
// Lifecycle
// ============================================================================

FlushOutcome PluginHost::on_register(const RegisterFn& register_fn) {
    std::call_once(register_once_, [&] {
        if (!register_fn) {
            register_status_ = FlushOutcome::ERROR;
            return;
        }
        const int rc = register_fn(kPluginName, kPluginDescription);
        register_status_ = rc == 0 ? FlushOutcome::OK : FlushOutcome::ERROR;
        if (rc != 0) {
            utils::log::error(std::format("[kinesis] host rejected plugin registration (rc={})", rc));
        }
    });
    return register_status_;
}

Result<uint32_t> PluginHost::on_init(const IConfigSource& source) {
    configure_logging();

    auto result = registry_.create(source);
    if (result.is_error()) {
        utils::log::error(std::format("[kinesis] Failed to initialize plugin: {}",
                                      result.error_message()));
    }
    return result;
}

FlushOutcome PluginHost::on_flush(uint32_t id, IBatchDecoder& decoder, const std::string& tag) {
    if (id >= registry_.size()) {
        utils::log::error(std::format("[kinesis] flush for unknown plugin id {}", id));
        return FlushOutcome::ERROR;
    }

    NormalizedBatch batch = normalizer_.normalize(decoder);

    if (batch.decode_failed && batch.count == 0) {
        utils::log::error(std::format("[kinesis {}] could not decode any record for tag '{}': {}",
                                      id, tag, batch.decode_error));
        return FlushOutcome::ERROR;
    }

    return dispatcher_.dispatch(id, tag, std::move(batch));
}

void PluginHost::configure_logging(std::optional<utils::log::Level> level) {
    std::call_once(logging_once_, [level] {
        if (level) {
            utils::log::set_level(*level);
        } else {
            utils::log::setup_from_env();
        }
    });
}

FlushOutcome PluginHost::on_exit() {
    const bool drained = dispatcher_.shutdown();
    const auto stats = dispatcher_.get_stats();
    utils::log::info(std::format(
        "[kinesis] exit: {} tasks dispatched, {} succeeded, {} failed, {} retry-exhausted, {} timed out{}",
        stats.tasks_dispatched, stats.tasks_succeeded, stats.tasks_failed,
        stats.tasks_retry_exhausted, stats.tasks_timed_out,
        drained ? "" : " (drain timed out)"));
    return FlushOutcome::OK;
}

} // namespace flbkinesis
