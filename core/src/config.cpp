#include "flbplug/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace flbplug {

static std::string env_or(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string(fallback);
}

bool parse_log_level(const std::string& s, LogLevel* out) {
    std::string val(s);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "error")                     { *out = LogLevel::ERROR; return true; }
    if (val == "warn" || val == "warning")  { *out = LogLevel::WARN;  return true; }
    if (val == "info")                      { *out = LogLevel::INFO;  return true; }
    if (val == "debug")                     { *out = LogLevel::DEBUG; return true; }
    return false;
}

LogLevel detect_log_level() {
    const char* env = std::getenv("FLBPLUG_LOG_LEVEL");
    if (!env) return LogLevel::INFO;

    LogLevel l = LogLevel::INFO;
    if (!parse_log_level(env, &l)) return LogLevel::INFO;
    return l;
}

std::string log_path_from_env() {
    return env_or("FLBPLUG_LOG_PATH", "");
}

std::string plugin_dir_from_env() {
    return env_or("FLBPLUG_PLUGIN_DIR", ".");
}

bool abi_lax_from_env() {
    const char* lax = std::getenv("FLBPLUG_PLUGIN_ABI_LAX");
    return lax && std::string(lax) == "1";
}

} // namespace flbplug
