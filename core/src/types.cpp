#include "flbplug/types.h"

namespace flbplug {

const FieldValue* Record::find(const std::string& key) const {
    for (const auto& kv : fields) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

const char* log_level_name(LogLevel l) {
    switch (l) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

} // namespace flbplug
