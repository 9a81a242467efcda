#pragma once

// Input plugin ABI (v1) shared by the host and dynamically loaded inputs.
//
// Conventions:
// - An input named <name> ships as flb-in_<name>.so and exports its
//   descriptor as `struct flbplug_input_plugin in_<name>_plugin`.
// - Every plugin also exports flbplug_abi_version() returning
//   FLBPLUG_ABI_VERSION. The loader rejects mismatches.
// - The plugin does not link against host symbols. Everything it needs from
//   the host is reached through ins->api.
// - Callbacks return 0 on success, non-zero on failure. The host never calls
//   them concurrently for one instance.

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#define FLBPLUG_ABI_VERSION 1

// Event types an input may produce.
#define FLBPLUG_EVENT_LOGS    0
#define FLBPLUG_EVENT_METRICS 1

// Configuration map value types.
#define FLBPLUG_CONFIG_MAP_STR  0
#define FLBPLUG_CONFIG_MAP_INT  1
#define FLBPLUG_CONFIG_MAP_BOOL 2

// Log levels accepted by flbplug_host_api::log.
#define FLBPLUG_LOG_ERROR 1
#define FLBPLUG_LOG_WARN  2
#define FLBPLUG_LOG_INFO  3
#define FLBPLUG_LOG_DEBUG 4

#ifdef __cplusplus
extern "C" {
#endif

struct flbplug_input_instance;
struct flbplug_config;  // opaque, host private

typedef int (*flbplug_collect_fn)(struct flbplug_input_instance* ins,
                                  struct flbplug_config* config,
                                  void* in_context);

// One recognized configuration key. Maps are terminated by an entry whose
// name is NULL.
struct flbplug_config_map {
    int type;
    const char* name;
    const char* def_value;
    const char* desc;
};

// Entry points the host provides to a running instance.
struct flbplug_host_api {
    int abi_version;

    // Raw property value, or NULL when the key was not set.
    const char* (*config_get)(struct flbplug_input_instance* ins, const char* key);

    // Stores the opaque context handed back on every later callback.
    void (*set_context)(struct flbplug_input_instance* ins, void* in_context);

    // Registers cb to run every sec seconds + nsec nanoseconds.
    // Returns a collector id >= 0, or -1 on failure.
    int (*set_collector_time)(struct flbplug_input_instance* ins,
                              flbplug_collect_fn cb,
                              time_t sec, long nsec,
                              struct flbplug_config* config);

    // Ingestion entry point. tag may be NULL with tag_len 0.
    int (*ingest)(struct flbplug_input_instance* ins,
                  const char* tag, size_t tag_len,
                  const void* buf, size_t size);

    void (*log)(struct flbplug_input_instance* ins, int level, const char* msg);
};

// Per-instance handle owned by the host.
struct flbplug_input_instance {
    const struct flbplug_host_api* api;
    const char* name;  // plugin name, e.g. "example"
    void* host_data;   // host private
};

struct flbplug_input_plugin {
    const char* name;
    const char* description;
    int event_type;

    int (*cb_init)(struct flbplug_input_instance* ins,
                   struct flbplug_config* config, void* data);
    int (*cb_pre_run)(struct flbplug_input_instance* ins,
                      struct flbplug_config* config, void* in_context);
    int (*cb_collect)(struct flbplug_input_instance* ins,
                      struct flbplug_config* config, void* in_context);
    int (*cb_exit)(void* in_context, struct flbplug_config* config);

    const struct flbplug_config_map* config_map;
};

typedef int (*flbplug_abi_version_fn)(void);

#ifdef __cplusplus
}
#endif
