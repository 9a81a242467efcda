#include "flbplug/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace flbplug {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Serialize with sorted keys so lines are stable and diffable.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    if (json_object_get_type(obj) != json_type_object) {
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        return;
    }

    std::vector<std::string> keys;
    json_object_object_foreach(obj, k, v) {
        (void)v;
        keys.emplace_back(k);
    }
    std::sort(keys.begin(), keys.end());

    out << "{";
    for (size_t i = 0; i < keys.size(); i++) {
        if (i > 0) out << ",";
        json_object* ks = json_object_new_string(keys[i].c_str());
        out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
        json_object_put(ks);
        out << ":";
        json_object* val = nullptr;
        json_object_object_get_ex(obj, keys[i].c_str(), &val);
        canonical_serialize(val, out);
    }
    out << "}";
}

JsonlLogger::JsonlLogger(LogLevel min_level, const std::string& path)
    : min_level_(min_level), path_(path) {
    if (!path_.empty()) out_.open(path_, std::ios::out | std::ios::app);
}

void JsonlLogger::event(LogLevel level, const std::string& plugin,
                        const std::string& name, const std::string& message) {
    if (!enabled(level)) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "level", json_object_new_string(log_level_name(level)));
    json_object_object_add(rec, "message",
        json_object_new_string_len(message.c_str(), static_cast<int>(message.size())));
    json_object_object_add(rec, "plugin", json_object_new_string(plugin.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    if (out_.is_open()) {
        out_ << line.str() << "\n";
        out_.flush();
    } else {
        std::cerr << line.str() << std::endl;
    }
}

} // namespace flbplug
