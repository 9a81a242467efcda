#include "flbplug/example_input.h"
#include "flbplug/config_map.h"
#include "flbplug/record_codec.h"

#include <cstdio>
#include <memory>

namespace flbplug::example {

const flbplug_config_map CONFIG_MAP[] = {
    {FLBPLUG_CONFIG_MAP_INT, INTERVAL_KEY, "30", "Collect interval."},
    {0, nullptr, nullptr, nullptr},
};

bool HostBinding::valid() const {
    return ins_ && ins_->api && ins_->api->abi_version == FLBPLUG_ABI_VERSION;
}

std::optional<std::string> HostBinding::property(const char* key) const {
    if (!ins_->api->config_get) return std::nullopt;
    const char* v = ins_->api->config_get(ins_, key);
    if (!v) return std::nullopt;
    return std::string(v);
}

void HostBinding::set_context(void* in_context) const {
    if (ins_->api->set_context) ins_->api->set_context(ins_, in_context);
}

int HostBinding::set_collector_time(flbplug_collect_fn cb, time_t sec, long nsec,
                                    flbplug_config* config) const {
    if (!ins_->api->set_collector_time) return -1;
    return ins_->api->set_collector_time(ins_, cb, sec, nsec, config);
}

int HostBinding::ingest(const std::string& buf) const {
    if (!ins_->api->ingest) return -1;
    return ins_->api->ingest(ins_, nullptr, 0, buf.data(), buf.size());
}

void HostBinding::log(LogLevel level, const std::string& msg) const {
    if (ins_ && ins_->api && ins_->api->log) {
        ins_->api->log(ins_, static_cast<int>(level), msg.c_str());
        return;
    }
    std::fprintf(stderr, "[in_%s] %s: %s\n", PLUGIN_NAME, log_level_name(level), msg.c_str());
}

ContextTable& contexts() {
    static ContextTable table;
    return table;
}

bool resolve_interval(const HostBinding& host, long* out, std::string* err) {
    auto raw = host.property(INTERVAL_KEY);
    if (!raw) {
        *out = DEFAULT_INTERVAL_SEC;
        return true;
    }
    return parse_int_property(INTERVAL_KEY, *raw, 1, MAX_INTERVAL_SEC, out, err);
}

Record make_record(const Timestamp& ts, uint64_t n) {
    Record r;
    r.ts = ts;
    r.fields.emplace_back(COUNTER_FIELD, FieldValue{n});
    return r;
}

int init(flbplug_input_instance* ins, flbplug_config* config, flbplug_collect_fn collect_cb) {
    HostBinding host(ins);
    if (!host.valid()) {
        host.log(LogLevel::ERROR, "init: missing or incompatible host API");
        return -1;
    }

    long interval = 0;
    std::string err;
    if (!resolve_interval(host, &interval, &err)) {
        host.log(LogLevel::ERROR, "invalid configuration: " + err);
        return -1;
    }

    void* handle = contexts().adopt(std::make_unique<InputContext>());
    host.set_context(handle);

    int id = host.set_collector_time(collect_cb, static_cast<time_t>(interval), 0, config);
    if (id < 0) {
        host.set_context(nullptr);
        contexts().release(handle);
        host.log(LogLevel::ERROR, "could not register collector");
        return -1;
    }

    host.log(LogLevel::DEBUG, "collector " + std::to_string(id) + " every "
                              + std::to_string(interval) + "s");
    return 0;
}

int collect(flbplug_input_instance* ins, void* in_context, ClockFn clock) {
    HostBinding host(ins);
    if (!host.valid()) {
        host.log(LogLevel::ERROR, "collect: missing or incompatible host API");
        return -1;
    }
    InputContext* ctx = contexts().lookup(in_context);
    if (!ctx) {
        host.log(LogLevel::ERROR, "collect: unknown context");
        return -1;
    }
    ctx->collect_count++;

    Timestamp ts;
    std::string err;
    if (!clock(&ts, &err)) {
        host.log(LogLevel::ERROR, "clock: " + err);
        return -1;
    }

    std::string buf;
    if (!encode_record(make_record(ts, ctx->collect_count), &buf, &err)) {
        host.log(LogLevel::ERROR, "encode: " + err);
        return -1;
    }

    int ret = host.ingest(buf);
    if (ret != 0) {
        host.log(LogLevel::ERROR, "ingest failed with status " + std::to_string(ret));
    }
    return ret;
}

int shutdown(void* in_context) {
    auto ctx = contexts().release(in_context);
    if (!ctx) {
        std::fprintf(stderr, "[in_%s] error: exit: unknown context\n", PLUGIN_NAME);
        return -1;
    }
    return 0;
}

} // namespace flbplug::example
