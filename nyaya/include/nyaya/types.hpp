#pragma once
// Core types: the atoms of the graph
//
// A Triple is a fact: subject, predicate, object. Triples are values;
// once built they are never edited, only removed and replaced.
// Identity is content: the same fact always hashes to the same TripleId.

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace nyaya {

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Split an identifier at its last '#', '/' or ':'
inline size_t namespace_split(const std::string& s) {
    size_t pos = s.find_last_of("#/:");
    return pos == std::string::npos ? 0 : pos + 1;
}

// ═══════════════════════════════════════════════════════════════════════════
// NodeId: named (stable string) or blank (random 128-bit, no external meaning)
// ═══════════════════════════════════════════════════════════════════════════

struct NodeId {
    enum class Kind : uint8_t {
        Named = 1,
        Blank = 2,
    };

    Kind kind = Kind::Named;
    std::string name;       // Named only
    uint64_t high = 0;      // Blank only
    uint64_t low = 0;

    static NodeId named(std::string n) {
        NodeId id;
        id.kind = Kind::Named;
        id.name = std::move(n);
        return id;
    }

    static NodeId blank() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dis;
        return blank(dis(gen), dis(gen));
    }

    static NodeId blank(uint64_t high, uint64_t low) {
        NodeId id;
        id.kind = Kind::Blank;
        id.high = high;
        id.low = low;
        return id;
    }

    bool is_named() const { return kind == Kind::Named; }
    bool is_blank() const { return kind == Kind::Blank; }

    bool operator==(const NodeId& other) const {
        if (kind != other.kind) return false;
        return is_named() ? name == other.name
                          : (high == other.high && low == other.low);
    }

    bool operator!=(const NodeId& other) const { return !(*this == other); }

    bool operator<(const NodeId& other) const {
        if (kind != other.kind) return kind < other.kind;
        if (is_named()) return name < other.name;
        return high < other.high || (high == other.high && low < other.low);
    }

    std::string to_string() const {
        if (is_named()) return "<" + name + ">";
        char buf[40];
        snprintf(buf, sizeof(buf), "_:b%016llx%016llx",
                 (unsigned long long)high, (unsigned long long)low);
        return buf;
    }

    // Accepts "<name>", "_:b<32 hex>" and, leniently, a bare name
    static std::optional<NodeId> parse(const std::string& s) {
        if (s.empty()) return std::nullopt;
        if (s.size() >= 2 && s.front() == '<' && s.back() == '>') {
            return named(s.substr(1, s.size() - 2));
        }
        if (s.rfind("_:b", 0) == 0) {
            if (s.size() != 3 + 32) return std::nullopt;
            unsigned long long h = 0, l = 0;
            std::string hs = s.substr(3, 16), ls = s.substr(19, 16);
            if (hs.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos ||
                ls.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                return std::nullopt;
            }
            h = std::stoull(hs, nullptr, 16);
            l = std::stoull(ls, nullptr, 16);
            return blank(h, l);
        }
        return named(s);
    }

    std::string namespace_part() const {
        if (!is_named()) return "";
        return name.substr(0, namespace_split(name));
    }

    std::string local_name() const {
        if (!is_named()) return to_string();
        return name.substr(namespace_split(name));
    }
};

struct NodeIdHash {
    size_t operator()(const NodeId& id) const {
        if (id.is_named()) return std::hash<std::string>{}(id.name);
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Predicate: relationship label, compared by string
// ═══════════════════════════════════════════════════════════════════════════

struct Predicate {
    std::string name;

    Predicate() = default;
    Predicate(std::string n) : name(std::move(n)) {}
    Predicate(const char* n) : name(n) {}

    bool empty() const { return name.empty(); }

    bool operator==(const Predicate& other) const { return name == other.name; }
    bool operator!=(const Predicate& other) const { return name != other.name; }
    bool operator<(const Predicate& other) const { return name < other.name; }

    std::string to_string() const { return "<" + name + ">"; }
    std::string namespace_part() const { return name.substr(0, namespace_split(name)); }
    std::string local_name() const { return name.substr(namespace_split(name)); }
};

// ═══════════════════════════════════════════════════════════════════════════
// Value: the object of a triple
// ═══════════════════════════════════════════════════════════════════════════

enum class ValueKind : uint8_t {
    Node = 0,
    String = 1,
    Integer = 2,
    Float = 3,
    Boolean = 4,
};

inline const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Node: return "node";
        case ValueKind::String: return "string";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float: return "float";
        case ValueKind::Boolean: return "boolean";
    }
    return "unknown";
}

// Bit pattern used for hashing and equality; every NaN collapses to one
inline uint64_t canonical_float_bits(double d) {
    if (std::isnan(d)) return 0x7FF8000000000000ULL;
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return bits;
}

class Value {
public:
    using Data = std::variant<NodeId, std::string, int64_t, double, bool>;

    Value() : data_(std::string()) {}

    static Value node(NodeId n) { return Value(Data(std::in_place_index<0>, std::move(n))); }
    static Value node(const std::string& name) { return node(NodeId::named(name)); }
    static Value string(std::string s) { return Value(Data(std::in_place_index<1>, std::move(s))); }
    static Value integer(int64_t n) { return Value(Data(std::in_place_index<2>, n)); }
    static Value floating(double d) { return Value(Data(std::in_place_index<3>, d)); }
    static Value boolean(bool b) { return Value(Data(std::in_place_index<4>, b)); }

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_node() const { return kind() == ValueKind::Node; }
    bool is_string() const { return kind() == ValueKind::String; }
    bool is_integer() const { return kind() == ValueKind::Integer; }
    bool is_float() const { return kind() == ValueKind::Float; }
    bool is_boolean() const { return kind() == ValueKind::Boolean; }
    bool is_numeric() const { return is_integer() || is_float(); }

    const NodeId* as_node() const { return std::get_if<0>(&data_); }
    const std::string* as_string() const { return std::get_if<1>(&data_); }

    std::optional<int64_t> as_integer() const {
        if (auto* n = std::get_if<2>(&data_)) return *n;
        return std::nullopt;
    }

    std::optional<double> as_float() const {
        if (auto* d = std::get_if<3>(&data_)) return *d;
        if (auto* n = std::get_if<2>(&data_)) return static_cast<double>(*n);
        return std::nullopt;
    }

    std::optional<bool> as_boolean() const {
        if (auto* b = std::get_if<4>(&data_)) return *b;
        return std::nullopt;
    }

    const Data& data() const { return data_; }

    bool operator==(const Value& other) const {
        if (data_.index() != other.data_.index()) return false;
        switch (kind()) {
            case ValueKind::Node: return std::get<0>(data_) == std::get<0>(other.data_);
            case ValueKind::String: return std::get<1>(data_) == std::get<1>(other.data_);
            case ValueKind::Integer: return std::get<2>(data_) == std::get<2>(other.data_);
            case ValueKind::Float:
                return canonical_float_bits(std::get<3>(data_)) ==
                       canonical_float_bits(std::get<3>(other.data_));
            case ValueKind::Boolean: return std::get<4>(data_) == std::get<4>(other.data_);
        }
        return false;
    }

    bool operator!=(const Value& other) const { return !(*this == other); }

    // Total order: kind first, then payload. Only used for deterministic output.
    bool operator<(const Value& other) const {
        if (data_.index() != other.data_.index()) return data_.index() < other.data_.index();
        switch (kind()) {
            case ValueKind::Node: return std::get<0>(data_) < std::get<0>(other.data_);
            case ValueKind::String: return std::get<1>(data_) < std::get<1>(other.data_);
            case ValueKind::Integer: return std::get<2>(data_) < std::get<2>(other.data_);
            case ValueKind::Float: {
                double a = std::get<3>(data_), b = std::get<3>(other.data_);
                if (std::isnan(a) || std::isnan(b)) return !std::isnan(a) && std::isnan(b);
                return a < b;
            }
            case ValueKind::Boolean: return std::get<4>(data_) < std::get<4>(other.data_);
        }
        return false;
    }

    std::string to_string() const {
        switch (kind()) {
            case ValueKind::Node: return std::get<0>(data_).to_string();
            case ValueKind::String: return quote(std::get<1>(data_));
            case ValueKind::Integer: return std::to_string(std::get<2>(data_));
            case ValueKind::Float: return format_float(std::get<3>(data_));
            case ValueKind::Boolean: return std::get<4>(data_) ? "true" : "false";
        }
        return "";
    }

    // Shortest text that reads back as a double (always has '.', 'e', or is inf/nan)
    static std::string format_float(double d) {
        if (std::isnan(d)) return "NaN";
        if (std::isinf(d)) return d > 0 ? "INF" : "-INF";
        char buf[32];
        for (int precision = 15; precision <= 17; ++precision) {
            snprintf(buf, sizeof(buf), "%.*g", precision, d);
            if (std::strtod(buf, nullptr) == d) break;
        }
        std::string s(buf);
        if (s.find_first_of(".eE") == std::string::npos) s += ".0";
        return s;
    }

    static std::string quote(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: out += c;
            }
        }
        out += "\"";
        return out;
    }

private:
    explicit Value(Data d) : data_(std::move(d)) {}

    Data data_;
};

// -1, 0, 1 for comparable values; nullopt when the kinds cannot be ordered
inline std::optional<int> compare_values(const Value& a, const Value& b) {
    if (a.is_numeric() && b.is_numeric()) {
        if (a.is_integer() && b.is_integer()) {
            int64_t x = *a.as_integer(), y = *b.as_integer();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = *a.as_float(), y = *b.as_float();
        if (std::isnan(x) || std::isnan(y)) return std::nullopt;
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        int c = a.as_string()->compare(*b.as_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Triple and its content address
// ═══════════════════════════════════════════════════════════════════════════

struct Triple {
    NodeId subject;
    Predicate predicate;
    Value object;

    Triple() = default;
    Triple(NodeId s, Predicate p, Value o)
        : subject(std::move(s)), predicate(std::move(p)), object(std::move(o)) {}

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }

    bool operator<(const Triple& other) const {
        if (subject != other.subject) return subject < other.subject;
        if (predicate != other.predicate) return predicate < other.predicate;
        return object < other.object;
    }

    std::string to_string() const {
        return "(" + subject.to_string() + " " + predicate.to_string() + " " +
               object.to_string() + ")";
    }
};

// 256-bit digest of a triple's canonical encoding
struct TripleId {
    std::array<uint8_t, 32> bytes{};

    bool operator==(const TripleId& other) const { return bytes == other.bytes; }
    bool operator!=(const TripleId& other) const { return bytes != other.bytes; }
    bool operator<(const TripleId& other) const { return bytes < other.bytes; }

    std::string to_hex() const {
        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(64);
        for (uint8_t b : bytes) {
            out += digits[b >> 4];
            out += digits[b & 0x0F];
        }
        return out;
    }

    std::string short_hex() const { return to_hex().substr(0, 12); }

    static std::optional<TripleId> from_hex(const std::string& hex) {
        if (hex.size() != 64) return std::nullopt;
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        TripleId id;
        for (size_t i = 0; i < 32; ++i) {
            int hi = nibble(hex[2 * i]), lo = nibble(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            id.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return id;
    }
};

struct TripleIdHash {
    size_t operator()(const TripleId& id) const {
        size_t h;
        std::memcpy(&h, id.bytes.data(), sizeof(h));
        return h;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// TriplePattern: absent field matches anything
// ═══════════════════════════════════════════════════════════════════════════

struct TriplePattern {
    std::optional<NodeId> subject;
    std::optional<Predicate> predicate;
    std::optional<Value> object;

    static TriplePattern any() { return {}; }

    static TriplePattern exact(const Triple& t) {
        TriplePattern p;
        p.subject = t.subject;
        p.predicate = t.predicate;
        p.object = t.object;
        return p;
    }

    TriplePattern with_subject(NodeId s) const {
        TriplePattern p = *this;
        p.subject = std::move(s);
        return p;
    }

    TriplePattern with_predicate(Predicate pred) const {
        TriplePattern p = *this;
        p.predicate = std::move(pred);
        return p;
    }

    TriplePattern with_object(Value o) const {
        TriplePattern p = *this;
        p.object = std::move(o);
        return p;
    }

    bool matches(const Triple& t) const {
        if (subject && *subject != t.subject) return false;
        if (predicate && *predicate != t.predicate) return false;
        if (object && *object != t.object) return false;
        return true;
    }

    size_t bound_count() const {
        return (subject ? 1 : 0) + (predicate ? 1 : 0) + (object ? 1 : 0);
    }

    bool is_wildcard() const { return bound_count() == 0; }
    bool is_exact() const { return bound_count() == 3; }

    std::string to_string() const {
        return "(" + (subject ? subject->to_string() : std::string("*")) + " " +
               (predicate ? predicate->to_string() : std::string("*")) + " " +
               (object ? object->to_string() : std::string("*")) + ")";
    }
};

} // namespace nyaya
