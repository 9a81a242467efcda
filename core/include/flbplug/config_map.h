#pragma once
#include "plugin_api.h"

#include <cstddef>
#include <string>

namespace flbplug {

// Number of entries before the NULL-name terminator. map may be null.
size_t config_map_size(const flbplug_config_map* map);

// Case-insensitive lookup. Returns nullptr when key is not recognized.
const flbplug_config_map* find_config_entry(const flbplug_config_map* map, const std::string& key);

// Strict base-10 integer in [min_v, max_v]: no sign-less garbage, no
// trailing characters, no surrounding blanks.
bool parse_int_property(const std::string& key, const std::string& raw,
                        long min_v, long max_v, long* out, std::string* err);

} // namespace flbplug
