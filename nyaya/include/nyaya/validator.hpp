#pragma once
// Validator: checks candidate triples against the store before insertion
//
// Three built-in checks run without any rule:
//   functional predicates  one object per subject; a second is Fatal
//   exclusive pairs        (s p o) and (s q o) for exclusive p/q is an Error
//   temporal order         a "before" edge closing a cycle is an Error
//
// Then every enabled Integrity, Authority and Constraint rule is run with
// the candidate standing in for each of its conditions in turn. Reject
// actions report their reason; Require actions report when their pattern
// has no match. Validation reads the store and never writes it.

#include "unify.hpp"
#include <set>

namespace nyaya {

struct ValidatorConfig {
    std::set<std::string> functional_predicates;
    std::vector<std::pair<std::string, std::string>> exclusive_pairs;
    std::string temporal_predicate = "before";
};

struct ValidationError {
    Severity severity = Severity::Error;
    std::string rule_name;
    std::string message;

    bool operator==(const ValidationError& other) const {
        return severity == other.severity && rule_name == other.rule_name &&
               message == other.message;
    }

    std::string to_string() const {
        return std::string("[") + nyaya::to_string(severity) + "] " + rule_name + ": " + message;
    }
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationError> errors;

    void add(ValidationError e) {
        if (std::find(errors.begin(), errors.end(), e) != errors.end()) return;
        if (e.severity != Severity::Warning) valid = false;
        errors.push_back(std::move(e));
    }

    size_t error_count(Severity s) const {
        return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
            [s](const ValidationError& e) { return e.severity == s; }));
    }

    void merge(const ValidationResult& other) {
        for (const auto& e : other.errors) add(e);
    }

    // Contradiction when anything is Fatal, ValidationFailed otherwise
    void throw_if_invalid() const {
        if (valid) return;
        const ValidationError* first = nullptr;
        for (const auto& e : errors) {
            if (e.severity == Severity::Fatal) {
                throw LogicError(LogicErrorKind::Contradiction, e.to_string());
            }
            if (!first && e.severity == Severity::Error) first = &e;
        }
        throw LogicError(LogicErrorKind::ValidationFailed,
                         first ? first->to_string() : std::string("invalid"));
    }
};

struct Contradiction {
    Triple a;
    Triple b;
    std::string description;
};

// The store as it would look with candidates inserted
class OverlayFacts : public FactSource {
public:
    OverlayFacts(const GraphStore& store, const std::vector<Triple>& extra)
        : store_(store), extra_(extra) {}

    std::vector<Triple> find(const TriplePattern& pattern) const override {
        auto out = store_.find(pattern);
        for (const auto& t : extra_) {
            if (!pattern.matches(t)) continue;
            if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
        }
        return out;
    }

    std::optional<Triple> get(const TripleId& id) const override {
        if (auto t = store_.get(id)) return t;
        for (const auto& t : extra_) {
            if (triple_id(t) == id) return t;
        }
        return std::nullopt;
    }

private:
    const GraphStore& store_;
    const std::vector<Triple>& extra_;
};

class Validator {
public:
    explicit Validator(const GraphStore& store, ValidatorConfig config = {})
        : store_(store), config_(std::move(config)) {}

    const ValidatorConfig& config() const { return config_; }

    bool is_functional(const Predicate& p) const {
        return config_.functional_predicates.count(p.name) > 0;
    }

    ValidationResult validate(const Triple& candidate, const RuleSet& rules) const {
        return validate(std::vector<Triple>{candidate}, rules);
    }

    // The batch is checked as if all of it were already stored
    ValidationResult validate(const std::vector<Triple>& batch, const RuleSet& rules) const {
        ValidationResult result;
        OverlayFacts facts(store_, batch);

        for (const auto& t : batch) {
            check_functional(t, facts, result);
            check_exclusive(t, facts, result);
            check_temporal(t, facts, result);
            for (const auto& rule : rules.rules()) {
                if (rule.enabled && rule.validates()) check_rule(rule, t, facts, result);
            }
        }

        log_debug("Validator", "%zu candidates: %s (%zu errors)", batch.size(),
                  result.valid ? "valid" : "invalid", result.errors.size());
        return result;
    }

    // Every conflict already present in the store
    std::vector<Contradiction> check_contradictions() const {
        std::vector<Contradiction> out;

        for (const auto& name : config_.functional_predicates) {
            auto triples = store_.find(TriplePattern().with_predicate(Predicate(name)));
            std::sort(triples.begin(), triples.end());
            for (size_t i = 1; i < triples.size(); ++i) {
                const auto& prev = triples[i - 1];
                const auto& cur = triples[i];
                if (prev.subject == cur.subject && prev.object != cur.object) {
                    out.push_back({prev, cur, "functional predicate " + name +
                                   " has two values for " + cur.subject.to_string()});
                }
            }
        }

        for (const auto& pair : config_.exclusive_pairs) {
            auto triples = store_.find(TriplePattern().with_predicate(Predicate(pair.first)));
            std::sort(triples.begin(), triples.end());
            for (const auto& t : triples) {
                Triple other(t.subject, Predicate(pair.second), t.object);
                if (store_.contains(other)) {
                    out.push_back({t, other, pair.first + " and " + pair.second +
                                   " are mutually exclusive"});
                }
            }
        }

        auto edges = store_.find(TriplePattern().with_predicate(Predicate(config_.temporal_predicate)));
        std::sort(edges.begin(), edges.end());
        for (const auto& t : edges) {
            const NodeId* target = t.object.as_node();
            if (!target) continue;
            if (*target == t.subject) {
                out.push_back({t, t, t.subject.to_string() + " is " +
                               config_.temporal_predicate + " itself"});
                continue;
            }
            Triple back(*target, Predicate(config_.temporal_predicate), Value::node(t.subject));
            if (t.subject < *target && store_.contains(back)) {
                out.push_back({t, back, "temporal cycle between " + t.subject.to_string() +
                               " and " + target->to_string()});
            }
        }
        return out;
    }

private:
    // ═══════════════════════════════════════════════════════════════════════
    // Built-in checks
    // ═══════════════════════════════════════════════════════════════════════

    void check_functional(const Triple& t, const FactSource& facts, ValidationResult& result) const {
        if (!is_functional(t.predicate)) return;
        auto existing = facts.find(TriplePattern().with_subject(t.subject).with_predicate(t.predicate));
        std::sort(existing.begin(), existing.end());
        for (const auto& other : existing) {
            if (other.object == t.object) continue;
            result.add({Severity::Fatal, "functional:" + t.predicate.name,
                        t.subject.to_string() + " " + t.predicate.name + " is " +
                        t.object.to_string() + " but also " + other.object.to_string()});
        }
    }

    void check_exclusive(const Triple& t, const FactSource& facts, ValidationResult& result) const {
        for (const auto& pair : config_.exclusive_pairs) {
            std::string other;
            if (t.predicate.name == pair.first) other = pair.second;
            else if (t.predicate.name == pair.second) other = pair.first;
            else continue;

            if (facts.contains(Triple(t.subject, Predicate(other), t.object))) {
                result.add({Severity::Error, "exclusive:" + pair.first + "/" + pair.second,
                            t.to_string() + " contradicts " + other + " on the same object"});
            }
        }
    }

    // Cycle if the subject is reachable from the object along temporal edges
    void check_temporal(const Triple& t, const FactSource& facts, ValidationResult& result) const {
        if (t.predicate.name != config_.temporal_predicate) return;
        const NodeId* target = t.object.as_node();
        if (!target) return;

        Predicate before(config_.temporal_predicate);
        std::set<NodeId> seen{*target};
        std::vector<NodeId> stack{*target};
        while (!stack.empty()) {
            NodeId current = std::move(stack.back());
            stack.pop_back();
            if (current == t.subject) {
                result.add({Severity::Error, "temporal:" + config_.temporal_predicate,
                            t.to_string() + " closes a cycle"});
                return;
            }
            for (const auto& edge : facts.find(TriplePattern().with_subject(current).with_predicate(before))) {
                const NodeId* next = edge.object.as_node();
                if (next && seen.insert(*next).second) stack.push_back(*next);
            }
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Rules
    // ═══════════════════════════════════════════════════════════════════════

    void check_rule(const Rule& rule, const Triple& candidate, const FactSource& facts,
                    ValidationResult& result) const {
        for (size_t i = 0; i < rule.conditions.size(); ++i) {
            auto seed = unify(rule.conditions[i].pattern, candidate);
            if (!seed) continue;

            std::vector<Condition> rest;
            for (size_t j = 0; j < rule.conditions.size(); ++j) {
                if (j != i) rest.push_back(rule.conditions[j]);
            }

            for (const auto& m : match_conditions(facts, rest, *seed)) {
                if (!satisfies_all(rule.conditions, m.bindings)) continue;
                apply_actions(rule, m.bindings, facts, result);
            }
        }
    }

    void apply_actions(const Rule& rule, const Substitution& s, const FactSource& facts,
                       ValidationResult& result) const {
        for (const auto& action : rule.actions) {
            switch (action.kind) {
                case Action::Kind::Assert:
                    break;
                case Action::Kind::Reject: {
                    std::string why = action.reason.empty() ? rule.description : action.reason;
                    result.add({rule.severity, rule.name, render(why, s)});
                    break;
                }
                case Action::Kind::Require: {
                    auto q = to_query(action.pattern, s);
                    bool found = false;
                    if (q) {
                        for (const auto& t : facts.find(*q)) {
                            if (unify(action.pattern, t, s)) {
                                found = true;
                                break;
                            }
                        }
                    }
                    if (!found) {
                        result.add({rule.severity, rule.name,
                                    "requires " + action.pattern.to_string() + " for " +
                                    render(pattern_text(action.pattern), s)});
                    }
                    break;
                }
            }
        }
    }

    static std::string pattern_text(const Pattern& p) {
        std::set<std::string> vars;
        p.collect_variables(vars);
        std::string out;
        for (const auto& v : vars) out += (out.empty() ? "?" : ", ?") + v;
        return out.empty() ? p.to_string() : out;
    }

    const GraphStore& store_;
    ValidatorConfig config_;
};

} // namespace nyaya
