#pragma once
#include "types.h"
#include <fstream>
#include <mutex>
#include <string>

namespace flbplug {

// One JSON object per line, keys sorted:
//   {"event":..,"level":..,"message":..,"plugin":..,"ts":..}
// Writes to path, or to stderr when path is empty.
class JsonlLogger {
public:
    explicit JsonlLogger(LogLevel min_level, const std::string& path = "");

    bool enabled(LogLevel l) const { return static_cast<int>(l) <= static_cast<int>(min_level_); }

    void event(LogLevel level, const std::string& plugin,
               const std::string& name, const std::string& message);

    const std::string& path() const { return path_; }
    LogLevel min_level() const { return min_level_; }

private:
    LogLevel min_level_;
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

} // namespace flbplug
