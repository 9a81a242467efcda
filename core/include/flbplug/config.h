#pragma once
#include "types.h"

#include <string>

namespace flbplug {

// Detect log level from FLBPLUG_LOG_LEVEL env var. Default: INFO.
LogLevel detect_log_level();

// Parse a level name (case-insensitive). Returns false on unknown names.
bool parse_log_level(const std::string& s, LogLevel* out);

// FLBPLUG_LOG_PATH, or empty for stderr.
std::string log_path_from_env();

// FLBPLUG_PLUGIN_DIR, or "." when unset.
std::string plugin_dir_from_env();

// True when FLBPLUG_PLUGIN_ABI_LAX=1.
bool abi_lax_from_env();

} // namespace flbplug
