#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace flbplug {

// Event time carried in every record.
struct Timestamp {
    uint32_t sec{0};
    uint32_t nsec{0}; // 0..999999999
};

// Nil is encoded as msgpack nil.
struct Nil {
    bool operator==(const Nil&) const { return true; }
};

using FieldValue = std::variant<Nil, bool, uint64_t, int64_t, double, std::string>;

// Ordered: keys are written in insertion order.
using FieldMap = std::vector<std::pair<std::string, FieldValue>>;

struct Record {
    Timestamp ts;
    FieldMap fields;

    // Returns nullptr when key is absent.
    const FieldValue* find(const std::string& key) const;
};

enum class LogLevel {
    ERROR = 1,
    WARN  = 2,
    INFO  = 3,
    DEBUG = 4,
};

const char* log_level_name(LogLevel l);

} // namespace flbplug
