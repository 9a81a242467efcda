// Shared object entry points for the "example" input (flb-in_example.so).
// The host resolves in_example_plugin by name; everything else stays local.

#include "flbplug/example_input.h"
#include "flbplug/plugin_api.h"

#include <cstdio>
#include <new>

using namespace flbplug;

static int cb_collect(flbplug_input_instance* ins, flbplug_config* config, void* in_context) {
    (void)config;
    try {
        return example::collect(ins, in_context, &realtime_now);
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "[in_example] error: collect: out of memory\n");
        return -1;
    }
}

static int cb_init(flbplug_input_instance* ins, flbplug_config* config, void* data) {
    (void)data;
    try {
        return example::init(ins, config, &cb_collect);
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "[in_example] error: init: out of memory\n");
        return -1;
    }
}

static int cb_exit(void* in_context, flbplug_config* config) {
    (void)config;
    return example::shutdown(in_context);
}

extern "C" {

__attribute__((visibility("default")))
int flbplug_abi_version() {
    return FLBPLUG_ABI_VERSION;
}

__attribute__((visibility("default")))
struct flbplug_input_plugin in_example_plugin = {
    example::PLUGIN_NAME,
    example::PLUGIN_DESCRIPTION,
    FLBPLUG_EVENT_LOGS,
    cb_init,
    nullptr, // cb_pre_run
    cb_collect,
    cb_exit,
    example::CONFIG_MAP,
};

} // extern "C"
