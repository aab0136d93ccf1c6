#include "plugin/plugin_interface.hpp"
#include "plugin/host_config_source.hpp"
#include "plugin/plugin_host.hpp"
#include "core/utils.hpp"
#include "ingest/msgpack_batch_decoder.hpp"

#include <format>

using flbkinesis::FlushOutcome;
using flbkinesis::PluginHost;
using flbkinesis::to_host_code;

namespace {

// The ABI carries no user pointer at register time, so the host object is process-wide
PluginHost& plugin_host() {
    static PluginHost host(PluginHost::default_factory());
    return host;
}

bool api_usable(const FlbHostApi* api) {
    if (!api) {
        flbkinesis::utils::log::error("[kinesis] host API table is null");
        return false;
    }
    if (api->api_version != FLBKINESIS_PLUGIN_API_VERSION) {
        flbkinesis::utils::log::error(std::format("[kinesis] host API version {} != plugin API version {}",
                                                  api->api_version, FLBKINESIS_PLUGIN_API_VERSION));
        return false;
    }
    return true;
}

} // anonymous namespace

extern "C" {

int FLBPluginRegister(const FlbHostApi* api) {
    if (!api_usable(api) || !api->register_plugin) {
        return FLB_ERROR;
    }
    try {
        const FlushOutcome outcome = plugin_host().on_register(
            [api](const char* name, const char* description) {
                return api->register_plugin(api->host, name, description);
            });
        return to_host_code(outcome);
    } catch (const std::exception& e) {
        flbkinesis::utils::log::error(std::format("[kinesis] register failed: {}", e.what()));
        return FLB_ERROR;
    }
}

int FLBPluginInit(FlbOutputContext* ctx) {
    if (!ctx || !api_usable(ctx->api)) {
        return FLB_ERROR;
    }
    try {
        const flbkinesis::HostConfigSource source(*ctx->api, ctx->instance);
        const auto result = plugin_host().on_init(source);
        if (result.is_error()) {
            return FLB_ERROR;
        }
        ctx->plugin_id = result.value();
        return FLB_OK;
    } catch (const std::exception& e) {
        flbkinesis::utils::log::error(std::format("[kinesis] Failed to initialize plugin: {}", e.what()));
        return FLB_ERROR;
    }
}

int FLBPluginFlushCtx(FlbOutputContext* ctx, const void* data, int length, const char* tag) {
    if (!ctx || (!data && length > 0) || length < 0) {
        return FLB_ERROR;
    }
    try {
        flbkinesis::MsgpackBatchDecoder decoder(data, static_cast<size_t>(length));
        return to_host_code(plugin_host().on_flush(ctx->plugin_id, decoder, tag ? tag : ""));
    } catch (const std::exception& e) {
        flbkinesis::utils::log::error(std::format("[kinesis {}] flush failed: {}", ctx->plugin_id, e.what()));
        return FLB_ERROR;
    }
}

int FLBPluginExit(void) {
    try {
        return to_host_code(plugin_host().on_exit());
    } catch (const std::exception& e) {
        flbkinesis::utils::log::error(std::format("[kinesis] exit: {}", e.what()));
        return FLB_OK;
    }
}

} // extern "C"
