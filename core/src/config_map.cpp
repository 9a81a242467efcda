#include "flbplug/config_map.h"

#include <strings.h>

#include <cerrno>
#include <cstdlib>

namespace flbplug {

size_t config_map_size(const flbplug_config_map* map) {
    size_t n = 0;
    if (!map) return 0;
    while (map[n].name) n++;
    return n;
}

const flbplug_config_map* find_config_entry(const flbplug_config_map* map, const std::string& key) {
    if (!map) return nullptr;
    for (const flbplug_config_map* e = map; e->name; e++) {
        if (strcasecmp(e->name, key.c_str()) == 0) return e;
    }
    return nullptr;
}

bool parse_int_property(const std::string& key, const std::string& raw,
                        long min_v, long max_v, long* out, std::string* err) {
    if (raw.empty()) {
        if (err) *err = key + ": empty value";
        return false;
    }
    const char* s = raw.c_str();
    if (!(*s == '-' || *s == '+' || (*s >= '0' && *s <= '9'))) {
        if (err) *err = key + ": not an integer: '" + raw + "'";
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') {
        if (err) *err = key + ": not an integer: '" + raw + "'";
        return false;
    }
    if (errno == ERANGE || v < min_v || v > max_v) {
        if (err) *err = key + ": out of range [" + std::to_string(min_v) + ", "
                      + std::to_string(max_v) + "]: '" + raw + "'";
        return false;
    }
    *out = v;
    return true;
}

} // namespace flbplug
