#include "flbplug/record_codec.h"

#include <json-c/json.h>
#include <msgpack.h>

#include <cstdio>
#include <limits>

namespace flbplug {

namespace {

struct SBuffer {
    msgpack_sbuffer sbuf;
    SBuffer() { msgpack_sbuffer_init(&sbuf); }
    ~SBuffer() { msgpack_sbuffer_destroy(&sbuf); }
    SBuffer(const SBuffer&) = delete;
    SBuffer& operator=(const SBuffer&) = delete;
};

struct Unpacked {
    msgpack_unpacked u;
    Unpacked() { msgpack_unpacked_init(&u); }
    ~Unpacked() { msgpack_unpacked_destroy(&u); }
    Unpacked(const Unpacked&) = delete;
    Unpacked& operator=(const Unpacked&) = delete;
};

void put_be32(char* p, uint32_t v) {
    p[0] = static_cast<char>((v >> 24) & 0xff);
    p[1] = static_cast<char>((v >> 16) & 0xff);
    p[2] = static_cast<char>((v >> 8) & 0xff);
    p[3] = static_cast<char>(v & 0xff);
}

uint32_t get_be32(const char* p) {
    const auto* u = reinterpret_cast<const unsigned char*>(p);
    return (uint32_t(u[0]) << 24) | (uint32_t(u[1]) << 16) |
           (uint32_t(u[2]) << 8) | uint32_t(u[3]);
}

int pack_str(msgpack_packer* pk, const std::string& s) {
    if (msgpack_pack_str(pk, s.size()) != 0) return -1;
    return msgpack_pack_str_body(pk, s.data(), s.size());
}

int pack_value(msgpack_packer* pk, const FieldValue& v) {
    if (std::holds_alternative<Nil>(v)) return msgpack_pack_nil(pk);
    if (auto* b = std::get_if<bool>(&v)) return *b ? msgpack_pack_true(pk) : msgpack_pack_false(pk);
    if (auto* u = std::get_if<uint64_t>(&v)) return msgpack_pack_uint64(pk, *u);
    if (auto* i = std::get_if<int64_t>(&v)) return msgpack_pack_int64(pk, *i);
    if (auto* d = std::get_if<double>(&v)) return msgpack_pack_double(pk, *d);
    return pack_str(pk, std::get<std::string>(v));
}

bool unpack_value(const msgpack_object& o, FieldValue* out, std::string* err) {
    switch (o.type) {
        case MSGPACK_OBJECT_NIL:              *out = Nil{}; return true;
        case MSGPACK_OBJECT_BOOLEAN:          *out = static_cast<bool>(o.via.boolean); return true;
        case MSGPACK_OBJECT_POSITIVE_INTEGER: *out = static_cast<uint64_t>(o.via.u64); return true;
        case MSGPACK_OBJECT_NEGATIVE_INTEGER: *out = static_cast<int64_t>(o.via.i64); return true;
        case MSGPACK_OBJECT_FLOAT32:
        case MSGPACK_OBJECT_FLOAT64:          *out = o.via.f64; return true;
        case MSGPACK_OBJECT_STR:              *out = std::string(o.via.str.ptr, o.via.str.size); return true;
        default:
            if (err) *err = "unsupported field value type " + std::to_string(static_cast<int>(o.type));
            return false;
    }
}

} // namespace

bool encode_record(const Record& rec, std::string* out, std::string* err) {
    if (!out) {
        if (err) *err = "output buffer is null";
        return false;
    }
    if (rec.ts.nsec >= NSEC_PER_SEC) {
        if (err) *err = "nanoseconds out of range: " + std::to_string(rec.ts.nsec);
        return false;
    }
    if (rec.fields.size() > std::numeric_limits<uint32_t>::max()) {
        if (err) *err = "too many fields";
        return false;
    }

    SBuffer b;
    msgpack_packer pk;
    msgpack_packer_init(&pk, &b.sbuf, msgpack_sbuffer_write);

    char tbuf[8];
    put_be32(tbuf, rec.ts.sec);
    put_be32(tbuf + 4, rec.ts.nsec);

    int rc = msgpack_pack_array(&pk, 2);
    if (rc == 0) rc = msgpack_pack_ext(&pk, sizeof(tbuf), EVENT_TIME_EXT_TYPE);
    if (rc == 0) rc = msgpack_pack_ext_body(&pk, tbuf, sizeof(tbuf));
    if (rc == 0) rc = msgpack_pack_map(&pk, rec.fields.size());
    for (size_t i = 0; rc == 0 && i < rec.fields.size(); i++) {
        rc = pack_str(&pk, rec.fields[i].first);
        if (rc == 0) rc = pack_value(&pk, rec.fields[i].second);
    }
    if (rc != 0) {
        if (err) *err = "msgpack write failed";
        return false;
    }

    out->assign(b.sbuf.data, b.sbuf.size);
    return true;
}

bool decode_record(const void* buf, size_t size, Record* out, std::string* err) {
    if (!buf || size == 0) {
        if (err) *err = "empty buffer";
        return false;
    }
    if (!out) {
        if (err) *err = "output record is null";
        return false;
    }

    Unpacked up;
    size_t off = 0;
    msgpack_unpack_return ret =
        msgpack_unpack_next(&up.u, static_cast<const char*>(buf), size, &off);
    if (ret != MSGPACK_UNPACK_SUCCESS) {
        if (err) *err = "msgpack unpack failed (" + std::to_string(static_cast<int>(ret)) + ")";
        return false;
    }
    if (off != size) {
        if (err) *err = "trailing bytes after record: " + std::to_string(size - off);
        return false;
    }

    const msgpack_object& root = up.u.data;
    if (root.type != MSGPACK_OBJECT_ARRAY || root.via.array.size != 2) {
        if (err) *err = "record is not an array of 2";
        return false;
    }

    const msgpack_object& t = root.via.array.ptr[0];
    if (t.type != MSGPACK_OBJECT_EXT || t.via.ext.type != EVENT_TIME_EXT_TYPE || t.via.ext.size != 8) {
        if (err) *err = "timestamp is not an 8 byte event time ext";
        return false;
    }
    Record rec;
    rec.ts.sec = get_be32(t.via.ext.ptr);
    rec.ts.nsec = get_be32(t.via.ext.ptr + 4);
    if (rec.ts.nsec >= NSEC_PER_SEC) {
        if (err) *err = "nanoseconds out of range: " + std::to_string(rec.ts.nsec);
        return false;
    }

    const msgpack_object& m = root.via.array.ptr[1];
    if (m.type != MSGPACK_OBJECT_MAP) {
        if (err) *err = "record body is not a map";
        return false;
    }
    rec.fields.reserve(m.via.map.size);
    for (uint32_t i = 0; i < m.via.map.size; i++) {
        const msgpack_object_kv& kv = m.via.map.ptr[i];
        if (kv.key.type != MSGPACK_OBJECT_STR) {
            if (err) *err = "map key is not a string";
            return false;
        }
        FieldValue v;
        if (!unpack_value(kv.val, &v, err)) return false;
        rec.fields.emplace_back(std::string(kv.key.via.str.ptr, kv.key.via.str.size), std::move(v));
    }

    *out = std::move(rec);
    return true;
}

static json_object* value_to_json(const FieldValue& v) {
    if (std::holds_alternative<Nil>(v)) return nullptr;
    if (auto* b = std::get_if<bool>(&v)) return json_object_new_boolean(*b ? 1 : 0);
    if (auto* u = std::get_if<uint64_t>(&v)) return json_object_new_uint64(*u);
    if (auto* i = std::get_if<int64_t>(&v)) return json_object_new_int64(*i);
    if (auto* d = std::get_if<double>(&v)) return json_object_new_double(*d);
    const auto& s = std::get<std::string>(v);
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

std::string record_to_json(const Record& rec) {
    // Keep full nanosecond precision in the textual form of "date".
    char date[32];
    std::snprintf(date, sizeof(date), "%u.%09u", rec.ts.sec, rec.ts.nsec);
    double d = static_cast<double>(rec.ts.sec) + static_cast<double>(rec.ts.nsec) / NSEC_PER_SEC;

    json_object* o = json_object_new_object();
    json_object_object_add(o, "date", json_object_new_double_s(d, date));
    for (const auto& kv : rec.fields) {
        json_object_object_add(o, kv.first.c_str(), value_to_json(kv.second));
    }
    std::string s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return s;
}

} // namespace flbplug
