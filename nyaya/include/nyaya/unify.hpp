#pragma once
// Unification and conjunctive matching
//
// A Substitution maps variable names to concrete values. Unifying a pattern
// with a triple extends a substitution or fails; a variable already bound to
// a different value is a mismatch.
//
// match_conditions is the relational join behind forward chaining and rule
// validation: candidates for each condition come from FactSource::find with
// the substitution so far applied, then are unified to keep only consistent
// bindings.

#include "graph_store.hpp"
#include "rule.hpp"
#include <cctype>
#include <map>

namespace nyaya {

using Substitution = std::map<std::string, Value>;

// The value a predicate occupies when it is bound to a variable
inline Value predicate_value(const Predicate& p) {
    return Value::node(NodeId::named(p.name));
}

// Inverse of predicate_value; nullopt for anything but a named node
inline std::optional<Predicate> value_predicate(const Value& v) {
    const NodeId* n = v.as_node();
    if (!n || !n->is_named()) return std::nullopt;
    return Predicate(n->name);
}

// Bound value of a term, nullopt for wildcards and unbound variables
inline std::optional<Value> resolve(const Term& term, const Substitution& s) {
    if (term.is_constant()) return term.constant;
    if (term.is_var()) {
        auto it = s.find(term.variable);
        if (it != s.end()) return it->second;
    }
    return std::nullopt;
}

inline bool unify_term(const Term& term, const Value& value, Substitution& s) {
    switch (term.kind) {
        case Term::Kind::Any:
            return true;
        case Term::Kind::Constant:
            return term.constant == value;
        case Term::Kind::Variable: {
            auto [it, inserted] = s.emplace(term.variable, value);
            return inserted || it->second == value;
        }
    }
    return false;
}

inline std::optional<Substitution> unify(const Pattern& p, const Triple& t,
                                         const Substitution& s = {}) {
    Substitution out = s;
    if (!unify_term(p.subject, Value::node(t.subject), out)) return std::nullopt;
    if (!unify_term(p.predicate, predicate_value(t.predicate), out)) return std::nullopt;
    if (!unify_term(p.object, t.object, out)) return std::nullopt;
    return out;
}

// Store query for a pattern under s. nullopt when no stored triple can
// match (a subject bound to a literal, a predicate bound to a non-name).
inline std::optional<TriplePattern> to_query(const Pattern& p, const Substitution& s) {
    TriplePattern q;
    if (auto v = resolve(p.subject, s)) {
        const NodeId* n = v->as_node();
        if (!n) return std::nullopt;
        q.subject = *n;
    }
    if (auto v = resolve(p.predicate, s)) {
        auto pred = value_predicate(*v);
        if (!pred) return std::nullopt;
        q.predicate = std::move(*pred);
    }
    if (auto v = resolve(p.object, s)) {
        q.object = std::move(*v);
    }
    return q;
}

// Concrete triple for a template, nullopt if a slot is unbound or ill-typed
inline std::optional<Triple> try_instantiate(const Pattern& p, const Substitution& s) {
    auto subj = resolve(p.subject, s);
    auto pred = resolve(p.predicate, s);
    auto obj = resolve(p.object, s);
    if (!subj || !pred || !obj) return std::nullopt;
    const NodeId* n = subj->as_node();
    auto predicate = value_predicate(*pred);
    if (!n || !predicate) return std::nullopt;
    return Triple(*n, std::move(*predicate), std::move(*obj));
}

inline Triple instantiate(const Pattern& p, const Substitution& s) {
    auto t = try_instantiate(p, s);
    if (!t) {
        throw LogicError(LogicErrorKind::UnificationFailed,
                         "cannot instantiate " + p.to_string() + " under " +
                         std::to_string(s.size()) + " bindings");
    }
    return *t;
}

// A constraint whose variable is still unbound does not hold
inline bool satisfies(const Condition& c, const Substitution& s) {
    if (!c.constraint) return true;
    auto it = s.find(c.constraint->variable);
    return it != s.end() && c.constraint->holds(it->second);
}

inline bool satisfies_all(const std::vector<Condition>& conditions, const Substitution& s) {
    for (const auto& c : conditions) {
        if (!satisfies(c, s)) return false;
    }
    return true;
}

struct Match {
    Substitution bindings;
    std::vector<Triple> premises;   // one per condition, in condition order
};

// Join conditions left to right. Constraints are applied as soon as their
// variable is bound and checked once more on every complete match, so the
// result does not depend on which condition binds the variable.
inline std::vector<Match> match_conditions(const FactSource& facts,
                                           const std::vector<Condition>& conditions,
                                           const Substitution& initial = {}) {
    std::vector<Match> current{Match{initial, {}}};

    for (const auto& cond : conditions) {
        std::vector<Match> next;
        for (const auto& m : current) {
            auto q = to_query(cond.pattern, m.bindings);
            if (!q) continue;
            for (const auto& t : facts.find(*q)) {
                auto s = unify(cond.pattern, t, m.bindings);
                if (!s) continue;
                if (cond.constraint && s->count(cond.constraint->variable) &&
                    !satisfies(cond, *s)) {
                    continue;
                }
                Match extended{std::move(*s), m.premises};
                extended.premises.push_back(t);
                next.push_back(std::move(extended));
            }
        }
        current = std::move(next);
        if (current.empty()) break;
    }

    std::vector<Match> out;
    out.reserve(current.size());
    for (auto& m : current) {
        if (satisfies_all(conditions, m.bindings)) out.push_back(std::move(m));
    }
    return out;
}

// Unify conditions pairwise with an ordered premise list (proof replay)
inline std::optional<Substitution> unify_premises(const std::vector<Condition>& conditions,
                                                  const std::vector<Triple>& premises) {
    if (conditions.size() != premises.size()) return std::nullopt;
    Substitution s;
    for (size_t i = 0; i < conditions.size(); ++i) {
        auto next = unify(conditions[i].pattern, premises[i], s);
        if (!next) return std::nullopt;
        s = std::move(*next);
    }
    if (!satisfies_all(conditions, s)) return std::nullopt;
    return s;
}

// Replace ?name in text with the bound value
inline std::string render(const std::string& text, const Substitution& s) {
    std::string out;
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '?') {
            size_t j = i + 1;
            while (j < text.size() && (std::isalnum(static_cast<unsigned char>(text[j])) || text[j] == '_')) ++j;
            auto it = s.find(text.substr(i + 1, j - i - 1));
            if (j > i + 1 && it != s.end()) {
                out += it->second.to_string();
                i = j;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

} // namespace nyaya
