#pragma once
#include "flbplug/log.h"
#include "flbplug/plugin_api.h"

#include <ctime>
#include <functional>
#include <map>
#include <string>

namespace flbplug {

// Drives one input instance through init -> collect* -> exit and implements
// the host API the plugin calls back into. Enforces the lifecycle:
//   - properties can only be set before init, and must be in the config map;
//   - collect runs only between a successful init and exit;
//   - exit runs at most once, and only after a successful init.
class InputHost {
public:
    // Receives every buffer the plugin ingests. Non-zero is handed back to
    // the plugin as the ingestion status.
    using IngestSink = std::function<int(const char* tag, size_t tag_len,
                                         const void* buf, size_t size)>;

    enum class State { CREATED, RUNNING, FAILED, STOPPED };

    // plugin must outlive the host. logger may be null.
    InputHost(const flbplug_input_plugin* plugin, JsonlLogger* logger);
    ~InputHost();

    InputHost(const InputHost&) = delete;
    InputHost& operator=(const InputHost&) = delete;

    bool set_property(const std::string& key, const std::string& value, std::string* err);
    void set_ingest_sink(IngestSink sink) { sink_ = std::move(sink); }

    int initialize();
    // Runs the registered collector once.
    int collect_once();
    int shutdown();

    // cycles collections; waits the registered interval between them when
    // wait is set. Stops at the first non-zero status and returns it.
    int run(int cycles, bool wait);

    State state() const { return state_; }
    const std::string& name() const { return name_; }
    bool has_collector() const { return collector_.cb != nullptr; }
    time_t interval_sec() const { return collector_.sec; }
    long interval_nsec() const { return collector_.nsec; }
    void* context() const { return context_; }
    size_t ingested() const { return ingested_; }

private:
    struct Collector {
        flbplug_collect_fn cb{nullptr};
        time_t sec{0};
        long nsec{0};
        flbplug_config* config{nullptr};
    };

    static InputHost* self(flbplug_input_instance* ins);
    static const char* api_config_get(flbplug_input_instance* ins, const char* key);
    static void api_set_context(flbplug_input_instance* ins, void* in_context);
    static int api_set_collector_time(flbplug_input_instance* ins, flbplug_collect_fn cb,
                                      time_t sec, long nsec, flbplug_config* config);
    static int api_ingest(flbplug_input_instance* ins, const char* tag, size_t tag_len,
                          const void* buf, size_t size);
    static void api_log(flbplug_input_instance* ins, int level, const char* msg);

    void log(LogLevel level, const std::string& event, const std::string& msg);

    const flbplug_input_plugin* plugin_;
    JsonlLogger* logger_;
    std::string name_;
    flbplug_host_api api_{};
    flbplug_input_instance ins_{};
    std::map<std::string, std::string> props_;
    Collector collector_;
    void* context_{nullptr};
    IngestSink sink_;
    size_t ingested_{0};
    State state_{State::CREATED};
};

} // namespace flbplug
