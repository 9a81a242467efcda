#pragma once
#include "types.h"

#include <string>

namespace flbplug {

// Reads the current time into *out. Returns false (err filled) on failure.
using ClockFn = bool (*)(Timestamp* out, std::string* err);

// CLOCK_REALTIME, split into whole seconds and nanosecond remainder.
bool realtime_now(Timestamp* out, std::string* err);

} // namespace flbplug
