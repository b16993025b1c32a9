#pragma once
// JSON codecs for triples, rules, rule sets, proofs and reports
//
// Term text, used wherever a pattern slot appears:
//   "?x"            variable x
//   "*"             wildcard
//   "<name>"        named node
//   "_:b<hex>"      blank node
//   other strings   string literal (object slot) or name (subject, predicate)
//   numbers, bools  literals; {"string": "..."} forces a literal,
//                   {"float": "NaN"} carries non-finite floats
//
// Malformed documents raise LogicError{SerializationError}.

#include "proof.hpp"
#include "validator.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>

namespace nyaya {

using json = nlohmann::json;

namespace detail {

[[noreturn]] inline void bad_json(const std::string& what) {
    throw LogicError(LogicErrorKind::SerializationError, what);
}

inline bool looks_reserved(const std::string& s) {
    return s == "*" || (!s.empty() && s[0] == '?') || s.rfind("_:", 0) == 0 ||
           (s.size() >= 2 && s.front() == '<' && s.back() == '>');
}

inline const json& field(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) bad_json(std::string("missing field '") + key + "'");
    return j.at(key);
}

inline const json& array_field(const json& j, const char* key) {
    const json& v = field(j, key);
    if (!v.is_array()) bad_json(std::string("field '") + key + "' must be an array");
    return v;
}

inline std::string text_field(const json& j, const char* key) {
    const json& v = field(j, key);
    if (!v.is_string()) bad_json(std::string("field '") + key + "' must be a string");
    return v.get<std::string>();
}

} // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Values and triples
// ═══════════════════════════════════════════════════════════════════════════

inline json value_to_json(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Node:
            return v.as_node()->to_string();
        case ValueKind::String: {
            const std::string& s = *v.as_string();
            if (detail::looks_reserved(s)) return json{{"string", s}};
            return s;
        }
        case ValueKind::Integer:
            return *v.as_integer();
        case ValueKind::Float: {
            double d = *v.as_float();
            if (!std::isfinite(d)) return json{{"float", Value::format_float(d)}};
            return d;
        }
        case ValueKind::Boolean:
            return *v.as_boolean();
    }
    return nullptr;
}

// name_position: bare strings are names rather than literals
inline Value value_from_json(const json& j, bool name_position = false) {
    if (j.is_boolean()) return Value::boolean(j.get<bool>());
    if (j.is_number_integer()) return Value::integer(j.get<int64_t>());
    if (j.is_number_float()) return Value::floating(j.get<double>());
    if (j.is_object()) {
        if (j.contains("string") && j["string"].is_string()) {
            return Value::string(j["string"].get<std::string>());
        }
        if (j.contains("float") && j["float"].is_string()) {
            std::string f = j["float"].get<std::string>();
            if (f == "NaN") return Value::floating(std::nan(""));
            if (f == "INF") return Value::floating(HUGE_VAL);
            if (f == "-INF") return Value::floating(-HUGE_VAL);
            detail::bad_json("bad float '" + f + "'");
        }
        detail::bad_json("unrecognized value object " + j.dump());
    }
    if (!j.is_string()) detail::bad_json("unrecognized value " + j.dump());

    std::string s = j.get<std::string>();
    bool node_text = s.rfind("_:", 0) == 0 || (s.size() >= 2 && s.front() == '<' && s.back() == '>');
    if (node_text || name_position) {
        auto n = NodeId::parse(s);
        if (!n) detail::bad_json("bad node '" + s + "'");
        return Value::node(std::move(*n));
    }
    return Value::string(std::move(s));
}

inline json triple_to_json(const Triple& t) {
    return {
        {"subject", t.subject.to_string()},
        {"predicate", t.predicate.name},
        {"object", value_to_json(t.object)},
    };
}

inline Triple triple_from_json(const json& j) {
    auto subject = NodeId::parse(detail::text_field(j, "subject"));
    if (!subject) detail::bad_json("bad subject in " + j.dump());
    return Triple(std::move(*subject), Predicate(detail::text_field(j, "predicate")),
                  value_from_json(detail::field(j, "object")));
}

// ═══════════════════════════════════════════════════════════════════════════
// Terms, patterns, rules
// ═══════════════════════════════════════════════════════════════════════════

inline json term_to_json(const Term& t) {
    if (t.is_any()) return "*";
    if (t.is_var()) return "?" + t.variable;
    return value_to_json(t.constant);
}

inline Term term_from_json(const json& j, bool name_position) {
    if (j.is_string()) {
        std::string s = j.get<std::string>();
        if (s == "*") return Term::any();
        if (!s.empty() && s[0] == '?') {
            if (s.size() == 1) detail::bad_json("empty variable name");
            return Term::var(s.substr(1));
        }
    }
    return Term(value_from_json(j, name_position));
}

inline json pattern_to_json(const Pattern& p) {
    return json::array({term_to_json(p.subject), term_to_json(p.predicate), term_to_json(p.object)});
}

inline Pattern pattern_from_json(const json& j) {
    if (!j.is_array() || j.size() != 3) detail::bad_json("pattern must be [subject, predicate, object]");
    return Pattern(term_from_json(j[0], true), term_from_json(j[1], true), term_from_json(j[2], false));
}

inline json rule_to_json(const Rule& r) {
    json conditions = json::array();
    for (const auto& c : r.conditions) {
        json cj = {{"when", pattern_to_json(c.pattern)}};
        if (c.constraint) {
            cj["where"] = {
                {"variable", c.constraint->variable},
                {"op", to_string(c.constraint->op)},
                {"value", value_to_json(c.constraint->operand)},
            };
        }
        conditions.push_back(std::move(cj));
    }

    json actions = json::array();
    for (const auto& a : r.actions) {
        json aj = {{"kind", to_string(a.kind)}};
        if (a.kind == Action::Kind::Reject) {
            aj["reason"] = a.reason;
        } else {
            aj["pattern"] = pattern_to_json(a.pattern);
        }
        actions.push_back(std::move(aj));
    }

    return {
        {"name", r.name},
        {"kind", to_string(r.kind)},
        {"description", r.description},
        {"severity", to_string(r.severity)},
        {"priority", r.priority},
        {"enabled", r.enabled},
        {"conditions", std::move(conditions)},
        {"actions", std::move(actions)},
    };
}

// The result is checked like a built rule (InvalidRule on failure)
inline Rule rule_from_json(const json& j) {
    if (!j.is_object()) detail::bad_json("rule must be an object");

    Rule r;
    try {
        r.name = detail::text_field(j, "name");
        auto kind = parse_rule_kind(j.value("kind", std::string("inference")));
        if (!kind) detail::bad_json(r.name + ": unknown kind '" + j.value("kind", std::string()) + "'");
        r.kind = *kind;
        r.description = j.value("description", std::string());
        auto severity = parse_severity(j.value("severity", std::string("error")));
        if (!severity) detail::bad_json(r.name + ": unknown severity");
        r.severity = *severity;
        r.priority = j.value("priority", 0);
        r.enabled = j.value("enabled", true);

        for (const auto& cj : detail::array_field(j, "conditions")) {
            Condition c{pattern_from_json(detail::field(cj, "when")), std::nullopt};
            if (cj.contains("where")) {
                const json& w = cj["where"];
                auto op = parse_compare_op(detail::text_field(w, "op"));
                if (!op) detail::bad_json(r.name + ": unknown operator " + w["op"].dump());
                std::string variable = detail::text_field(w, "variable");
                if (!variable.empty() && variable[0] == '?') variable.erase(0, 1);
                c.constraint = Constraint{variable, *op, value_from_json(detail::field(w, "value"))};
            }
            r.conditions.push_back(std::move(c));
        }

        for (const auto& aj : detail::array_field(j, "actions")) {
            std::string kind = detail::text_field(aj, "kind");
            if (kind == "assert") {
                r.actions.push_back(Action::derive(pattern_from_json(detail::field(aj, "pattern"))));
            } else if (kind == "reject") {
                r.actions.push_back(Action::reject(aj.value("reason", std::string())));
            } else if (kind == "require") {
                r.actions.push_back(Action::require(pattern_from_json(detail::field(aj, "pattern"))));
            } else {
                detail::bad_json(r.name + ": unknown action '" + kind + "'");
            }
        }
    } catch (const json::exception& e) {
        detail::bad_json("rule " + r.name + ": " + e.what());
    }

    check_rule(r);
    return r;
}

inline json rules_to_json(const RuleSet& set) {
    json rules = json::array();
    for (const auto& r : set.rules()) rules.push_back(rule_to_json(r));
    return {{"name", set.name()}, {"rules", std::move(rules)}};
}

// Accepts {"name": ..., "rules": [...]} or a bare array of rules
inline RuleSet rules_from_json(const json& j) {
    const json* rules = &j;
    std::string name = "default";
    if (j.is_object()) {
        rules = &detail::field(j, "rules");
        name = j.value("name", name);
    }
    if (!rules->is_array()) detail::bad_json("'rules' must be an array");

    RuleSetBuilder builder(name);
    for (const auto& rj : *rules) builder.add(rule_from_json(rj));
    return builder.build();
}

inline json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) detail::bad_json("cannot open " + path);
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        detail::bad_json(path + ": " + e.what());
    }
}

inline RuleSet load_rules(const std::string& path) {
    return rules_from_json(read_json_file(path));
}

// ═══════════════════════════════════════════════════════════════════════════
// Proofs and reports
// ═══════════════════════════════════════════════════════════════════════════

inline json proof_to_json(const LogicProof& proof) {
    json steps = json::array();
    for (const auto& s : proof.steps) {
        json premises = json::array();
        for (const auto& id : s.premises) premises.push_back(id.to_hex());
        steps.push_back({
            {"rule", s.rule_name},
            {"premises", std::move(premises)},
            {"derived", triple_to_json(s.derived)},
        });
    }
    return {
        {"conclusion", triple_to_json(proof.conclusion)},
        {"steps", std::move(steps)},
        {"digest", proof.digest().to_hex()},
    };
}

// A digest that does not match the content is an InvalidProof
inline LogicProof proof_from_json(const json& j) {
    LogicProof proof;
    try {
        proof.conclusion = triple_from_json(detail::field(j, "conclusion"));
        for (const auto& sj : detail::array_field(j, "steps")) {
            ProofStep step;
            step.rule_name = detail::text_field(sj, "rule");
            for (const auto& pj : detail::array_field(sj, "premises")) {
                auto id = pj.is_string() ? TripleId::from_hex(pj.get<std::string>()) : std::nullopt;
                if (!id) detail::bad_json("bad premise id " + pj.dump());
                step.premises.push_back(*id);
            }
            step.derived = triple_from_json(detail::field(sj, "derived"));
            proof.steps.push_back(std::move(step));
        }
    } catch (const json::exception& e) {
        detail::bad_json(std::string("proof: ") + e.what());
    }

    if (j.contains("digest")) {
        if (!j["digest"].is_string()) detail::bad_json("digest must be a string");
        if (j["digest"].get<std::string>() != proof.digest().to_hex()) {
            throw LogicError(LogicErrorKind::InvalidProof, "digest does not match proof content");
        }
    }
    return proof;
}

inline json validation_to_json(const ValidationResult& result) {
    json errors = json::array();
    for (const auto& e : result.errors) {
        errors.push_back({
            {"severity", to_string(e.severity)},
            {"rule", e.rule_name},
            {"message", e.message},
        });
    }
    return {{"valid", result.valid}, {"errors", std::move(errors)}};
}

inline json contradiction_to_json(const Contradiction& c) {
    return {
        {"a", triple_to_json(c.a)},
        {"b", triple_to_json(c.b)},
        {"description", c.description},
    };
}

inline json stats_to_json(const GraphStats& s) {
    return {
        {"triples", s.triple_count},
        {"subjects", s.subject_count},
        {"predicates", s.predicate_count},
        {"objects", s.object_count},
        {"storage_bytes", s.storage_bytes},
    };
}

} // namespace nyaya
