#include "flbplug/input_host.h"
#include "flbplug/config_map.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace flbplug {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

InputHost::InputHost(const flbplug_input_plugin* plugin, JsonlLogger* logger)
    : plugin_(plugin), logger_(logger),
      name_(plugin && plugin->name ? plugin->name : "(unnamed)") {
    api_.abi_version = FLBPLUG_ABI_VERSION;
    api_.config_get = &InputHost::api_config_get;
    api_.set_context = &InputHost::api_set_context;
    api_.set_collector_time = &InputHost::api_set_collector_time;
    api_.ingest = &InputHost::api_ingest;
    api_.log = &InputHost::api_log;

    ins_.api = &api_;
    ins_.name = name_.c_str();
    ins_.host_data = this;
}

InputHost::~InputHost() {
    if (state_ == State::RUNNING) (void)shutdown();
}

InputHost* InputHost::self(flbplug_input_instance* ins) {
    return ins ? static_cast<InputHost*>(ins->host_data) : nullptr;
}

void InputHost::log(LogLevel level, const std::string& event, const std::string& msg) {
    if (logger_) logger_->event(level, name_, event, msg);
}

bool InputHost::set_property(const std::string& key, const std::string& value, std::string* err) {
    if (state_ != State::CREATED) {
        if (err) *err = "properties must be set before init";
        return false;
    }
    if (!find_config_entry(plugin_ ? plugin_->config_map : nullptr, key)) {
        if (err) *err = "unknown configuration property '" + key + "' for input " + name_;
        return false;
    }
    props_[lower(key)] = value;
    return true;
}

int InputHost::initialize() {
    if (state_ != State::CREATED) {
        log(LogLevel::ERROR, "lifecycle", "init called twice");
        return -1;
    }
    if (!plugin_ || !plugin_->cb_init) {
        log(LogLevel::ERROR, "lifecycle", "plugin has no cb_init");
        state_ = State::FAILED;
        return -1;
    }

    int ret = plugin_->cb_init(&ins_, nullptr, nullptr);
    if (ret != 0) {
        // A failed init owns nothing; forget whatever it reported.
        context_ = nullptr;
        collector_ = Collector{};
        state_ = State::FAILED;
        log(LogLevel::ERROR, "lifecycle", "init failed with status " + std::to_string(ret));
        return ret;
    }

    if (plugin_->cb_pre_run) {
        ret = plugin_->cb_pre_run(&ins_, nullptr, context_);
        if (ret != 0) {
            log(LogLevel::ERROR, "lifecycle", "pre_run failed with status " + std::to_string(ret));
            if (plugin_->cb_exit && plugin_->cb_exit(context_, nullptr) != 0) {
                log(LogLevel::WARN, "lifecycle", "exit after failed pre_run reported an error");
            }
            context_ = nullptr;
            collector_ = Collector{};
            state_ = State::FAILED;
            return ret;
        }
    }

    state_ = State::RUNNING;
    log(LogLevel::INFO, "lifecycle", "initialized");
    return 0;
}

int InputHost::collect_once() {
    if (state_ != State::RUNNING) {
        log(LogLevel::ERROR, "lifecycle", "collect outside of a running instance");
        return -1;
    }
    if (!collector_.cb) {
        log(LogLevel::ERROR, "lifecycle", "no collector registered");
        return -1;
    }
    return collector_.cb(&ins_, collector_.config, context_);
}

int InputHost::shutdown() {
    if (state_ != State::RUNNING) {
        log(LogLevel::ERROR, "lifecycle", "exit without a running instance");
        return -1;
    }
    int ret = plugin_->cb_exit ? plugin_->cb_exit(context_, nullptr) : 0;
    context_ = nullptr;
    collector_ = Collector{};
    state_ = State::STOPPED;
    log(ret == 0 ? LogLevel::INFO : LogLevel::ERROR, "lifecycle",
        "stopped with status " + std::to_string(ret));
    return ret;
}

int InputHost::run(int cycles, bool wait) {
    for (int i = 0; i < cycles; i++) {
        if (wait && i > 0) {
            std::this_thread::sleep_for(std::chrono::seconds(collector_.sec)
                                        + std::chrono::nanoseconds(collector_.nsec));
        }
        int ret = collect_once();
        if (ret != 0) return ret;
    }
    return 0;
}

const char* InputHost::api_config_get(flbplug_input_instance* ins, const char* key) {
    InputHost* h = self(ins);
    if (!h || !key) return nullptr;
    auto it = h->props_.find(lower(key));
    return it == h->props_.end() ? nullptr : it->second.c_str();
}

void InputHost::api_set_context(flbplug_input_instance* ins, void* in_context) {
    InputHost* h = self(ins);
    if (h) h->context_ = in_context;
}

int InputHost::api_set_collector_time(flbplug_input_instance* ins, flbplug_collect_fn cb,
                                      time_t sec, long nsec, flbplug_config* config) {
    InputHost* h = self(ins);
    if (!h || !cb) return -1;
    if (sec < 0 || nsec < 0 || nsec > 999999999L || (sec == 0 && nsec == 0)) {
        h->log(LogLevel::ERROR, "collector", "invalid interval");
        return -1;
    }
    if (h->collector_.cb) {
        h->log(LogLevel::ERROR, "collector", "a collector is already registered");
        return -1;
    }
    h->collector_ = Collector{cb, sec, nsec, config};
    return 0;
}

int InputHost::api_ingest(flbplug_input_instance* ins, const char* tag, size_t tag_len,
                          const void* buf, size_t size) {
    InputHost* h = self(ins);
    if (!h || !buf || size == 0) return -1;
    int ret = h->sink_ ? h->sink_(tag, tag_len, buf, size) : 0;
    if (ret == 0) h->ingested_++;
    return ret;
}

void InputHost::api_log(flbplug_input_instance* ins, int level, const char* msg) {
    InputHost* h = self(ins);
    if (!h) return;
    int l = std::clamp(level, static_cast<int>(LogLevel::ERROR), static_cast<int>(LogLevel::DEBUG));
    h->log(static_cast<LogLevel>(l), "plugin", msg ? msg : "");
}

} // namespace flbplug
