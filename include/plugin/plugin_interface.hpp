#pragma once

#include <cstddef>
#include <cstdint>

// C ABI between the log-routing host and this output plugin.
// The host fills FlbHostApi once and passes an FlbOutputContext per
// configured output section; the plugin exports the FLBPlugin* symbols.

#if defined(__GNUC__)
#define FLBKINESIS_EXPORT __attribute__((visibility("default")))
#else
#define FLBKINESIS_EXPORT
#endif

extern "C" {

// Outcome codes understood by the host
constexpr int FLB_ERROR = 0;
constexpr int FLB_OK = 1;
constexpr int FLB_RETRY = 2;

constexpr uint32_t FLBKINESIS_PLUGIN_API_VERSION = 1;

// Callbacks provided by the host
struct FlbHostApi {
    void* host;             // opaque, passed back to every callback
    uint32_t api_version;   // Must match FLBKINESIS_PLUGIN_API_VERSION

    // Announce the plugin; returns 0 on success
    int (*register_plugin)(void* host, const char* name, const char* description);

    // Value of a configuration key for one output instance (null = unset).
    // The returned string stays valid until the next call for that instance.
    const char* (*config_value)(void* host, void* instance, const char* key);
};

// One configured output section
struct FlbOutputContext {
    const FlbHostApi* api;
    void* instance;         // host handle for config_value
    uint32_t plugin_id;     // written by FLBPluginInit
};

FLBKINESIS_EXPORT int FLBPluginRegister(const FlbHostApi* api);
FLBKINESIS_EXPORT int FLBPluginInit(FlbOutputContext* ctx);
FLBKINESIS_EXPORT int FLBPluginFlushCtx(FlbOutputContext* ctx, const void* data, int length,
                                        const char* tag);
FLBKINESIS_EXPORT int FLBPluginExit(void);

} // extern "C"
