#pragma once
// Canonical codec: the one byte form of a triple
//
// Layout (all integers big-endian):
//   [codec version:u8]
//   subject   : 0x01 len:u32 bytes        (named)
//             | 0x02 high:u64 low:u64     (blank)
//   predicate : 0x10 len:u32 bytes
//   object    : 0x20 <subject encoding>   (node)
//             | 0x21 len:u32 bytes        (string)
//             | 0x22 i64                  (integer)
//             | 0x23 u64                  (float, canonical bits)
//             | 0x24 u8                   (boolean)
//
// Every variable-length field is length-prefixed and every field is tagged,
// so no two distinct triples share an encoding. The same bytes are stored by
// every backend and hashed (SHA-256) into the TripleId.

#include "types.hpp"
#include "error.hpp"
#include "version.hpp"
#include <openssl/evp.h>
#include <string>
#include <vector>

namespace nyaya {

constexpr uint8_t TAG_NAMED = 0x01;
constexpr uint8_t TAG_BLANK = 0x02;
constexpr uint8_t TAG_PREDICATE = 0x10;
constexpr uint8_t TAG_VALUE_NODE = 0x20;
constexpr uint8_t TAG_VALUE_STRING = 0x21;
constexpr uint8_t TAG_VALUE_INTEGER = 0x22;
constexpr uint8_t TAG_VALUE_FLOAT = 0x23;
constexpr uint8_t TAG_VALUE_BOOLEAN = 0x24;

// Upper bound for any single string field; larger lengths mean corruption
constexpr uint32_t MAX_FIELD_BYTES = 16u << 20;

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(v); }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void str(const std::string& s) {
        if (s.size() > MAX_FIELD_BYTES) {
            throw GraphError(GraphErrorKind::InvalidTriple,
                             "field of " + std::to_string(s.size()) + " bytes exceeds " +
                             std::to_string(MAX_FIELD_BYTES));
        }
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

private:
    std::vector<uint8_t>& out_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint32_t u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_++];
        return v;
    }

    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | data_[pos_++];
        return v;
    }

    std::string str() {
        uint32_t len = u32();
        if (len > MAX_FIELD_BYTES) {
            throw GraphError::serialization("field length " + std::to_string(len) + " out of range");
        }
        need(len);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return s;
    }

    bool done() const { return pos_ == size_; }
    size_t position() const { return pos_; }

private:
    void need(size_t n) const {
        if (size_ - pos_ < n) {
            throw GraphError::serialization("truncated payload at byte " + std::to_string(pos_));
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

inline void encode_node(ByteWriter& w, const NodeId& n) {
    if (n.is_named()) {
        w.u8(TAG_NAMED);
        w.str(n.name);
    } else {
        w.u8(TAG_BLANK);
        w.u64(n.high);
        w.u64(n.low);
    }
}

inline NodeId decode_node(ByteReader& r, uint8_t tag) {
    switch (tag) {
        case TAG_NAMED: return NodeId::named(r.str());
        case TAG_BLANK: {
            uint64_t high = r.u64();
            uint64_t low = r.u64();
            return NodeId::blank(high, low);
        }
        default:
            throw GraphError::serialization("unknown node tag " + std::to_string(tag));
    }
}

inline void encode_value(ByteWriter& w, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Node:
            w.u8(TAG_VALUE_NODE);
            encode_node(w, *v.as_node());
            break;
        case ValueKind::String:
            w.u8(TAG_VALUE_STRING);
            w.str(*v.as_string());
            break;
        case ValueKind::Integer:
            w.u8(TAG_VALUE_INTEGER);
            w.u64(static_cast<uint64_t>(*v.as_integer()));
            break;
        case ValueKind::Float:
            w.u8(TAG_VALUE_FLOAT);
            w.u64(canonical_float_bits(*v.as_float()));
            break;
        case ValueKind::Boolean:
            w.u8(TAG_VALUE_BOOLEAN);
            w.u8(*v.as_boolean() ? 1 : 0);
            break;
    }
}

inline Value decode_value(ByteReader& r) {
    uint8_t tag = r.u8();
    switch (tag) {
        case TAG_VALUE_NODE: return Value::node(decode_node(r, r.u8()));
        case TAG_VALUE_STRING: return Value::string(r.str());
        case TAG_VALUE_INTEGER: return Value::integer(static_cast<int64_t>(r.u64()));
        case TAG_VALUE_FLOAT: {
            uint64_t bits = r.u64();
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return Value::floating(d);
        }
        case TAG_VALUE_BOOLEAN: {
            uint8_t b = r.u8();
            if (b > 1) throw GraphError::serialization("boolean byte " + std::to_string(b));
            return Value::boolean(b == 1);
        }
        default:
            throw GraphError::serialization("unknown value tag " + std::to_string(tag));
    }
}

inline std::vector<uint8_t> encode(const Triple& t) {
    std::vector<uint8_t> out;
    out.reserve(32 + t.subject.name.size() + t.predicate.name.size());
    ByteWriter w(out);
    w.u8(NYAYA_CODEC_VERSION);
    encode_node(w, t.subject);
    w.u8(TAG_PREDICATE);
    w.str(t.predicate.name);
    encode_value(w, t.object);
    return out;
}

inline Triple decode_triple(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    uint8_t codec = r.u8();
    if (!version::codec_compatible(codec)) {
        throw GraphError::serialization("unsupported codec version " + std::to_string(codec));
    }
    Triple t;
    t.subject = decode_node(r, r.u8());
    if (r.u8() != TAG_PREDICATE) {
        throw GraphError::serialization("expected predicate tag");
    }
    t.predicate = Predicate(r.str());
    t.object = decode_value(r);
    if (!r.done()) {
        throw GraphError::serialization("trailing bytes after triple");
    }
    return t;
}

inline Triple decode_triple(const std::vector<uint8_t>& bytes) {
    return decode_triple(bytes.data(), bytes.size());
}

inline TripleId sha256(const uint8_t* data, size_t size) {
    TripleId id;
    unsigned int len = 0;
    if (EVP_Digest(data, size, id.bytes.data(), &len, EVP_sha256(), nullptr) != 1 || len != 32) {
        throw GraphError::serialization("SHA-256 digest failed");
    }
    return id;
}

inline TripleId triple_id(const Triple& t) {
    auto bytes = encode(t);
    return sha256(bytes.data(), bytes.size());
}

// Index keys: the tagged encoding of one component
inline std::string node_key(const NodeId& n) {
    std::vector<uint8_t> out;
    ByteWriter w(out);
    encode_node(w, n);
    return std::string(out.begin(), out.end());
}

inline std::string value_key(const Value& v) {
    std::vector<uint8_t> out;
    ByteWriter w(out);
    encode_value(w, v);
    return std::string(out.begin(), out.end());
}

} // namespace nyaya
