#pragma once
#include "flbplug/clock.h"
#include "flbplug/context_table.h"
#include "flbplug/plugin_api.h"
#include "flbplug/types.h"

#include <ctime>
#include <optional>
#include <string>

// Internals of the "example" input: every collection cycle emits one record
//   [now, {"collect-calls": <n>}]
// where n counts collector invocations since init. The exported C entry
// points in plugins/in_example only forward here.

namespace flbplug::example {

constexpr const char* PLUGIN_NAME = "example";
constexpr const char* PLUGIN_DESCRIPTION = "Emit a collect counter record on a fixed interval";
constexpr const char* COUNTER_FIELD = "collect-calls";
constexpr const char* INTERVAL_KEY = "interval_sec";
constexpr long DEFAULT_INTERVAL_SEC = 30;
constexpr long MAX_INTERVAL_SEC = 86400;

// NULL-terminated; exactly one key: interval_sec.
extern const flbplug_config_map CONFIG_MAP[];

// C++ view of the host API reachable from an instance handle.
class HostBinding {
public:
    explicit HostBinding(flbplug_input_instance* ins) : ins_(ins) {}

    // False when the handle or its API table is missing or of another ABI.
    bool valid() const;

    std::optional<std::string> property(const char* key) const;
    void set_context(void* in_context) const;
    int set_collector_time(flbplug_collect_fn cb, time_t sec, long nsec,
                           flbplug_config* config) const;
    int ingest(const std::string& buf) const;
    void log(LogLevel level, const std::string& msg) const;

private:
    flbplug_input_instance* ins_;
};

// Live contexts of every instance in this process.
ContextTable& contexts();

// Resolved interval_sec: the property if set, else the default.
bool resolve_interval(const HostBinding& host, long* out, std::string* err);

// Builds the record emitted for the n-th collection at time ts.
Record make_record(const Timestamp& ts, uint64_t n);

// Allocates the context, hands its handle to the host and registers
// collect_cb every interval_sec seconds. Nothing stays allocated on failure.
int init(flbplug_input_instance* ins, flbplug_config* config, flbplug_collect_fn collect_cb);

// One collection cycle. Returns the ingestion status unchanged, or -1 when
// the handle is unknown, the clock fails or encoding fails.
int collect(flbplug_input_instance* ins, void* in_context, ClockFn clock);

// Releases the context behind in_context. -1 when the handle is unknown.
int shutdown(void* in_context);

} // namespace flbplug::example
