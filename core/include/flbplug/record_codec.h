#pragma once
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace flbplug {

// msgpack ext type used for event time (Fluent Bit EventTime).
constexpr int8_t EVENT_TIME_EXT_TYPE = 0;
constexpr uint32_t NSEC_PER_SEC = 1000000000u;

// Encode rec as a self-contained msgpack buffer:
//   [ ext(0, be32 sec | be32 nsec), { key: value, ... } ]
// Fails (returns false, fills err) when nsec is out of range.
bool encode_record(const Record& rec, std::string* out, std::string* err);

// Inverse of encode_record. The buffer must hold exactly one record.
bool decode_record(const void* buf, size_t size, Record* out, std::string* err);

// One JSON line in json_lines form: {"date":<sec.nsec>,<fields>}.
std::string record_to_json(const Record& rec);

} // namespace flbplug
