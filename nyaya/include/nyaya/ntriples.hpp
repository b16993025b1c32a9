#pragma once
// N-Triples interchange
//
//   <alice> <knows> <bob> .
//   <alice> <age> "30"^^<http://www.w3.org/2001/XMLSchema#integer> .
//   _:b0123...  <label> "a \"quoted\" name" .
//
// Blank nodes written by this store (_:b + 32 hex) read back as the same
// node. Foreign blank labels get a fresh blank node per label per document.
// Language tags are accepted and dropped; unknown datatypes read as strings.
// Characters an IRI may not hold are written as UCHAR escapes (backslash-u
// and four hex digits) and decoded on read,
// so any node or predicate name survives a round trip.

#include "graph_store.hpp"
#include <cstdio>
#include <cstring>
#include <istream>
#include <ostream>
#include <sstream>

namespace nyaya {

namespace xsd {
constexpr const char* INTEGER = "http://www.w3.org/2001/XMLSchema#integer";
constexpr const char* DOUBLE = "http://www.w3.org/2001/XMLSchema#double";
constexpr const char* BOOLEAN = "http://www.w3.org/2001/XMLSchema#boolean";
}

// IRIREF forbids controls, space and <>"{}|^` and backslash; those are escaped
inline std::string ntriples_iri(const std::string& name) {
    std::string out = "<";
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || std::strchr("<>\"{}|^`\\", c) != nullptr) {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\u%04X", c);
            out += buf;
        } else {
            out += ch;
        }
    }
    out += ">";
    return out;
}

inline std::string ntriples_node(const NodeId& n) {
    return n.is_named() ? ntriples_iri(n.name) : n.to_string();
}

inline std::string ntriples_term(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Node: return ntriples_node(*v.as_node());
        case ValueKind::String: return Value::quote(*v.as_string());
        case ValueKind::Integer:
            return "\"" + std::to_string(*v.as_integer()) + "\"^^<" + xsd::INTEGER + ">";
        case ValueKind::Float:
            return "\"" + Value::format_float(*v.as_float()) + "\"^^<" + xsd::DOUBLE + ">";
        case ValueKind::Boolean:
            return std::string("\"") + (*v.as_boolean() ? "true" : "false") + "\"^^<" + xsd::BOOLEAN + ">";
    }
    return "";
}

inline std::string to_ntriples(const Triple& t) {
    return ntriples_node(t.subject) + " " + ntriples_iri(t.predicate.name) + " " +
           ntriples_term(t.object) + " .";
}

// Sorted output, so two stores with the same facts export the same text
inline size_t write_ntriples(std::ostream& out, std::vector<Triple> triples) {
    std::sort(triples.begin(), triples.end());
    for (const auto& t : triples) {
        out << to_ntriples(t) << "\n";
    }
    return triples.size();
}

inline size_t export_ntriples(const GraphStore& store, std::ostream& out) {
    return write_ntriples(out, store.find(TriplePattern::any()));
}

class NTriplesParser {
public:
    std::vector<Triple> parse(std::istream& in) {
        std::vector<Triple> out;
        std::string line;
        line_no_ = 0;
        while (std::getline(in, line)) {
            ++line_no_;
            line_ = &line;
            pos_ = 0;
            skip_ws();
            if (at_end() || peek() == '#') continue;

            Triple t;
            t.subject = read_subject();
            skip_ws();
            t.predicate = Predicate(read_iri());
            skip_ws();
            t.object = read_object();
            skip_ws();
            expect('.');
            skip_ws();
            if (!at_end() && peek() != '#') fail("unexpected text after '.'");
            out.push_back(std::move(t));
        }
        return out;
    }

private:
    bool at_end() const { return pos_ >= line_->size(); }
    char peek() const { return (*line_)[pos_]; }

    void skip_ws() {
        while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) ++pos_;
    }

    void expect(char c) {
        if (at_end() || peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw GraphError::serialization("n-triples line " + std::to_string(line_no_) +
                                        ", column " + std::to_string(pos_ + 1) + ": " + what);
    }

    std::string read_iri() {
        expect('<');
        size_t close = line_->find('>', pos_);
        if (close == std::string::npos) fail("unterminated IRI");
        std::string iri;
        while (pos_ < close) {
            char c = (*line_)[pos_++];
            if (c != '\\') {
                iri += c;
                continue;
            }
            if (pos_ >= close) fail("dangling escape in IRI");
            char e = (*line_)[pos_++];
            if (e != 'u' && e != 'U') fail(std::string("unknown IRI escape \\") + e);
            read_uchar(e == 'u' ? 4 : 8, iri);
        }
        pos_ = close + 1;
        if (iri.empty()) fail("empty IRI");
        return iri;
    }

    // UCHAR escape of 4 or 8 hex digits, appended as UTF-8
    void read_uchar(size_t digits, std::string& out) {
        if (line_->size() - pos_ < digits) fail("short unicode escape");
        uint32_t cp = 0;
        for (size_t i = 0; i < digits; ++i) {
            char h = (*line_)[pos_++];
            int v = (h >= '0' && h <= '9') ? h - '0'
                  : (h >= 'a' && h <= 'f') ? h - 'a' + 10
                  : (h >= 'A' && h <= 'F') ? h - 'A' + 10 : -1;
            if (v < 0) fail("bad hex digit in unicode escape");
            cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) fail("invalid code point in escape");
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    NodeId read_blank() {
        expect('_');
        expect(':');
        size_t start = pos_;
        while (!at_end() && peek() != ' ' && peek() != '\t' && peek() != '.') ++pos_;
        std::string label = line_->substr(start, pos_ - start);
        if (label.empty()) fail("empty blank node label");

        if (auto own = NodeId::parse("_:" + label); own && own->is_blank()) return *own;

        auto it = blank_labels_.find(label);
        if (it != blank_labels_.end()) return it->second;
        NodeId fresh = NodeId::blank();
        blank_labels_.emplace(label, fresh);
        return fresh;
    }

    NodeId read_subject() {
        if (at_end()) fail("missing subject");
        if (peek() == '<') return NodeId::named(read_iri());
        if (peek() == '_') return read_blank();
        fail("subject must be an IRI or blank node");
    }

    Value read_object() {
        if (at_end()) fail("missing object");
        if (peek() == '<') return Value::node(NodeId::named(read_iri()));
        if (peek() == '_') return Value::node(read_blank());
        if (peek() != '"') fail("object must be an IRI, blank node or literal");

        std::string lexical = read_quoted();
        if (!at_end() && peek() == '@') {
            while (!at_end() && peek() != ' ' && peek() != '\t') ++pos_;
            return Value::string(lexical);
        }
        if (!at_end() && peek() == '^') {
            expect('^');
            expect('^');
            return typed_literal(lexical, read_iri());
        }
        return Value::string(lexical);
    }

    std::string read_quoted() {
        expect('"');
        std::string s;
        while (true) {
            if (at_end()) fail("unterminated literal");
            char c = (*line_)[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                s += c;
                continue;
            }
            if (at_end()) fail("dangling escape");
            char e = (*line_)[pos_++];
            switch (e) {
                case 'n': s += '\n'; break;
                case 'r': s += '\r'; break;
                case 't': s += '\t'; break;
                case '"': s += '"'; break;
                case '\\': s += '\\'; break;
                case '\'': s += '\''; break;
                case 'b': s += '\b'; break;
                case 'f': s += '\f'; break;
                case 'u': read_uchar(4, s); break;
                case 'U': read_uchar(8, s); break;
                default: fail(std::string("unknown escape \\") + e);
            }
        }
        return s;
    }

    Value typed_literal(const std::string& lexical, const std::string& datatype) {
        auto local = datatype.substr(namespace_split(datatype));
        try {
            if (local == "integer" || local == "int" || local == "long") {
                size_t used = 0;
                long long n = std::stoll(lexical, &used);
                if (used != lexical.size()) fail("bad integer literal '" + lexical + "'");
                return Value::integer(n);
            }
            if (local == "double" || local == "float" || local == "decimal") {
                if (lexical == "NaN") return Value::floating(std::nan(""));
                if (lexical == "INF") return Value::floating(HUGE_VAL);
                if (lexical == "-INF") return Value::floating(-HUGE_VAL);
                size_t used = 0;
                double d = std::stod(lexical, &used);
                if (used != lexical.size()) fail("bad double literal '" + lexical + "'");
                return Value::floating(d);
            }
        } catch (const std::invalid_argument&) {
            fail("bad numeric literal '" + lexical + "'");
        } catch (const std::out_of_range&) {
            fail("numeric literal out of range '" + lexical + "'");
        }
        if (local == "boolean") {
            if (lexical == "true" || lexical == "1") return Value::boolean(true);
            if (lexical == "false" || lexical == "0") return Value::boolean(false);
            fail("bad boolean literal '" + lexical + "'");
        }
        return Value::string(lexical);
    }

    const std::string* line_ = nullptr;
    size_t pos_ = 0;
    size_t line_no_ = 0;
    std::unordered_map<std::string, NodeId> blank_labels_;
};

inline std::vector<Triple> parse_ntriples(std::istream& in) {
    return NTriplesParser().parse(in);
}

inline std::vector<Triple> parse_ntriples(const std::string& text) {
    std::istringstream in(text);
    return parse_ntriples(in);
}

// Returns the number of triples that were new to the store
inline size_t import_ntriples(GraphStore& store, std::istream& in) {
    size_t added = 0;
    for (const auto& t : parse_ntriples(in)) {
        if (store.insert_checked(t).second) ++added;
    }
    return added;
}

} // namespace nyaya
