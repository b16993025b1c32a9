#pragma once
// Rules: declarative conditions and actions over triple patterns
//
//   RuleBuilder::inference("grandparent")
//       .when(var("a"), "parent_of", var("b"))
//       .when(var("b"), "parent_of", var("c"))
//       .then_assert(var("a"), "grandparent_of", var("c"))
//       .build();
//
// Conditions are conjunctive and evaluated in declared order. A variable in
// predicate position binds to the named node of the same name, so one
// variable can carry a predicate into an object slot and back. For the same
// reason a bare string in any slot is a name; string literals go through lit().
//
// Rules are values. A RuleSet is frozen once built; changing a rule means
// building a new set (RuleSet::with_rule, RuleSetBuilder::replace).

#include "types.hpp"
#include "error.hpp"
#include <memory>
#include <set>

namespace nyaya {

enum class RuleKind : uint8_t {
    Integrity = 0,   // structural checks, run by the validator
    Authority = 1,   // who may assert what, run by the validator
    Temporal = 2,    // time-ordered facts
    Inference = 3,   // derives new triples
    Constraint = 4,  // domain constraints, run by the validator
};

inline const char* to_string(RuleKind kind) {
    switch (kind) {
        case RuleKind::Integrity: return "integrity";
        case RuleKind::Authority: return "authority";
        case RuleKind::Temporal: return "temporal";
        case RuleKind::Inference: return "inference";
        case RuleKind::Constraint: return "constraint";
    }
    return "unknown";
}

inline std::optional<RuleKind> parse_rule_kind(const std::string& s) {
    if (s == "integrity") return RuleKind::Integrity;
    if (s == "authority") return RuleKind::Authority;
    if (s == "temporal") return RuleKind::Temporal;
    if (s == "inference") return RuleKind::Inference;
    if (s == "constraint") return RuleKind::Constraint;
    return std::nullopt;
}

enum class Severity : uint8_t {
    Warning = 0,
    Error = 1,
    Fatal = 2,
};

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        case Severity::Fatal: return "fatal";
    }
    return "unknown";
}

inline std::optional<Severity> parse_severity(const std::string& s) {
    if (s == "warning") return Severity::Warning;
    if (s == "error") return Severity::Error;
    if (s == "fatal") return Severity::Fatal;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Terms and patterns
// ═══════════════════════════════════════════════════════════════════════════

struct Term {
    enum class Kind : uint8_t {
        Any = 0,
        Variable = 1,
        Constant = 2,
    };

    Kind kind = Kind::Any;
    std::string variable;
    Value constant;

    Term() = default;
    Term(Value v) : kind(Kind::Constant), constant(std::move(v)) {}
    Term(NodeId n) : kind(Kind::Constant), constant(Value::node(std::move(n))) {}

    // Predicate-position shorthand: "knows" is the named node <knows>
    Term(const std::string& predicate) : Term(Value::node(predicate)) {}
    Term(const char* predicate) : Term(Value::node(std::string(predicate))) {}

    static Term any() { return Term(); }

    static Term var(std::string name) {
        Term t;
        t.kind = Kind::Variable;
        t.variable = std::move(name);
        return t;
    }

    bool is_any() const { return kind == Kind::Any; }
    bool is_var() const { return kind == Kind::Variable; }
    bool is_constant() const { return kind == Kind::Constant; }

    bool operator==(const Term& other) const {
        if (kind != other.kind) return false;
        if (is_var()) return variable == other.variable;
        if (is_constant()) return constant == other.constant;
        return true;
    }
    bool operator!=(const Term& other) const { return !(*this == other); }

    std::string to_string() const {
        if (is_any()) return "*";
        if (is_var()) return "?" + variable;
        return constant.to_string();
    }
};

inline Term var(std::string name) { return Term::var(std::move(name)); }
inline Term node(const std::string& name) { return Term(Value::node(name)); }
inline Term lit(Value v) { return Term(std::move(v)); }
inline Term wildcard() { return Term::any(); }

struct Pattern {
    Term subject;
    Term predicate;
    Term object;

    Pattern() = default;
    Pattern(Term s, Term p, Term o)
        : subject(std::move(s)), predicate(std::move(p)), object(std::move(o)) {}

    void collect_variables(std::set<std::string>& out) const {
        for (const Term* t : {&subject, &predicate, &object}) {
            if (t->is_var()) out.insert(t->variable);
        }
    }

    bool has_wildcard() const {
        return subject.is_any() || predicate.is_any() || object.is_any();
    }

    bool operator==(const Pattern& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }

    std::string to_string() const {
        return "(" + subject.to_string() + " " + predicate.to_string() + " " +
               object.to_string() + ")";
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Constraints, conditions, actions
// ═══════════════════════════════════════════════════════════════════════════

enum class CompareOp : uint8_t {
    Eq = 0,
    Ne = 1,
    Lt = 2,
    Le = 3,
    Gt = 4,
    Ge = 5,
    Prefix = 6,     // string or node name starts with operand
    Contains = 7,   // string or node name contains operand
    NameAnyOf = 8,  // named node whose name holds any character of the operand string
};

inline const char* to_string(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "==";
        case CompareOp::Ne: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
        case CompareOp::Prefix: return "prefix";
        case CompareOp::Contains: return "contains";
        case CompareOp::NameAnyOf: return "name_any_of";
    }
    return "?";
}

inline std::optional<CompareOp> parse_compare_op(const std::string& s) {
    if (s == "==" || s == "eq") return CompareOp::Eq;
    if (s == "!=" || s == "ne") return CompareOp::Ne;
    if (s == "<" || s == "lt") return CompareOp::Lt;
    if (s == "<=" || s == "le") return CompareOp::Le;
    if (s == ">" || s == "gt") return CompareOp::Gt;
    if (s == ">=" || s == "ge") return CompareOp::Ge;
    if (s == "prefix") return CompareOp::Prefix;
    if (s == "contains") return CompareOp::Contains;
    if (s == "name_any_of") return CompareOp::NameAnyOf;
    return std::nullopt;
}

struct Constraint {
    std::string variable;
    CompareOp op = CompareOp::Eq;
    Value operand;

    // Text a string-matching op looks at: string literal or node name
    static const std::string* text_of(const Value& v) {
        if (v.is_string()) return v.as_string();
        if (const NodeId* n = v.as_node(); n && n->is_named()) return &n->name;
        return nullptr;
    }

    bool holds(const Value& bound) const {
        switch (op) {
            case CompareOp::Eq: return bound == operand ||
                                       (bound.is_numeric() && compare_values(bound, operand) == 0);
            case CompareOp::Ne: return !(bound == operand ||
                                         (bound.is_numeric() && compare_values(bound, operand) == 0));
            case CompareOp::Lt:
            case CompareOp::Le:
            case CompareOp::Gt:
            case CompareOp::Ge: {
                auto c = compare_values(bound, operand);
                if (!c) return false;
                if (op == CompareOp::Lt) return *c < 0;
                if (op == CompareOp::Le) return *c <= 0;
                if (op == CompareOp::Gt) return *c > 0;
                return *c >= 0;
            }
            case CompareOp::Prefix:
            case CompareOp::Contains: {
                const std::string* text = text_of(bound);
                const std::string* needle = text_of(operand);
                if (!text || !needle) return false;
                if (op == CompareOp::Prefix) return text->rfind(*needle, 0) == 0;
                return text->find(*needle) != std::string::npos;
            }
            case CompareOp::NameAnyOf: {
                const NodeId* n = bound.as_node();
                const std::string* chars = operand.as_string();
                if (!n || !n->is_named() || !chars) return false;
                return n->name.find_first_of(*chars) != std::string::npos;
            }
        }
        return false;
    }

    std::string to_string() const {
        return "?" + variable + " " + nyaya::to_string(op) + " " + operand.to_string();
    }
};

struct Condition {
    Pattern pattern;
    std::optional<Constraint> constraint;
};

struct Action {
    enum class Kind : uint8_t {
        Assert = 0,    // insert the instantiated template
        Reject = 1,    // validation error with reason
        Require = 2,   // validation error unless pattern holds
    };

    Kind kind = Kind::Assert;
    Pattern pattern;
    std::string reason;

    static Action derive(Pattern p) { return {Kind::Assert, std::move(p), ""}; }
    static Action reject(std::string reason) { return {Kind::Reject, Pattern(), std::move(reason)}; }
    static Action require(Pattern p) { return {Kind::Require, std::move(p), ""}; }
};

inline const char* to_string(Action::Kind kind) {
    switch (kind) {
        case Action::Kind::Assert: return "assert";
        case Action::Kind::Reject: return "reject";
        case Action::Kind::Require: return "require";
    }
    return "unknown";
}

struct Rule {
    std::string name;
    RuleKind kind = RuleKind::Inference;
    std::string description;
    Severity severity = Severity::Error;
    int priority = 0;
    bool enabled = true;
    std::vector<Condition> conditions;
    std::vector<Action> actions;

    bool has_assert() const {
        for (const auto& a : actions) {
            if (a.kind == Action::Kind::Assert) return true;
        }
        return false;
    }

    // Integrity, Authority and Constraint rules are checked by the validator
    bool validates() const {
        return kind == RuleKind::Integrity || kind == RuleKind::Authority ||
               kind == RuleKind::Constraint;
    }
};

// Throws InvalidRule describing the first problem found
inline void check_rule(const Rule& rule) {
    auto invalid = [&rule](const std::string& why) {
        return LogicError(LogicErrorKind::InvalidRule,
                          (rule.name.empty() ? std::string("<unnamed>") : rule.name) + ": " + why);
    };

    if (rule.name.empty()) throw invalid("empty name");
    if (rule.conditions.empty()) throw invalid("no conditions");
    if (rule.actions.empty()) throw invalid("no actions");

    auto check_terms = [&](const Pattern& p, const std::string& where) {
        if (p.subject.is_constant() && !p.subject.constant.is_node()) {
            throw invalid(where + ": subject constant must be a node");
        }
        if (p.predicate.is_constant()) {
            const NodeId* n = p.predicate.constant.as_node();
            if (!n || !n->is_named()) throw invalid(where + ": predicate constant must be a name");
        }
    };

    std::set<std::string> bound;
    for (size_t i = 0; i < rule.conditions.size(); ++i) {
        const auto& c = rule.conditions[i];
        check_terms(c.pattern, "condition " + std::to_string(i));
        c.pattern.collect_variables(bound);
        if (c.constraint && !bound.count(c.constraint->variable)) {
            throw invalid("constraint on ?" + c.constraint->variable +
                          " before any condition binds it");
        }
    }

    for (size_t i = 0; i < rule.actions.size(); ++i) {
        const auto& a = rule.actions[i];
        if (a.kind == Action::Kind::Reject) continue;
        std::string where = std::string(to_string(a.kind)) + " action " + std::to_string(i);
        check_terms(a.pattern, where);
        if (a.kind == Action::Kind::Assert && a.pattern.has_wildcard()) {
            throw invalid(where + ": template cannot contain a wildcard");
        }
        std::set<std::string> used;
        a.pattern.collect_variables(used);
        for (const auto& v : used) {
            if (!bound.count(v)) throw invalid(where + ": ?" + v + " is not bound by any condition");
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RuleBuilder
// ═══════════════════════════════════════════════════════════════════════════

class RuleBuilder {
public:
    RuleBuilder(std::string name, RuleKind kind) {
        rule_.name = std::move(name);
        rule_.kind = kind;
    }

    static RuleBuilder integrity(std::string name) { return RuleBuilder(std::move(name), RuleKind::Integrity); }
    static RuleBuilder authority(std::string name) { return RuleBuilder(std::move(name), RuleKind::Authority); }
    static RuleBuilder temporal(std::string name) { return RuleBuilder(std::move(name), RuleKind::Temporal); }
    static RuleBuilder inference(std::string name) { return RuleBuilder(std::move(name), RuleKind::Inference); }
    static RuleBuilder constraint(std::string name) { return RuleBuilder(std::move(name), RuleKind::Constraint); }

    RuleBuilder& describe(std::string text) { rule_.description = std::move(text); return *this; }
    RuleBuilder& severity(Severity s) { rule_.severity = s; return *this; }
    RuleBuilder& priority(int p) { rule_.priority = p; return *this; }
    RuleBuilder& enabled(bool on) { rule_.enabled = on; return *this; }

    RuleBuilder& when(Term s, Term p, Term o) {
        rule_.conditions.push_back({Pattern(std::move(s), std::move(p), std::move(o)), std::nullopt});
        return *this;
    }

    // Constrains the most recent condition
    RuleBuilder& where(std::string variable, CompareOp op, Value operand) {
        if (rule_.conditions.empty()) {
            error_ = "where() before any when()";
        } else if (rule_.conditions.back().constraint) {
            error_ = "condition " + std::to_string(rule_.conditions.size() - 1) + " already has a constraint";
        } else {
            rule_.conditions.back().constraint = Constraint{std::move(variable), op, std::move(operand)};
        }
        return *this;
    }

    RuleBuilder& then_assert(Term s, Term p, Term o) {
        rule_.actions.push_back(Action::derive(Pattern(std::move(s), std::move(p), std::move(o))));
        return *this;
    }

    RuleBuilder& then_reject(std::string reason) {
        rule_.actions.push_back(Action::reject(std::move(reason)));
        return *this;
    }

    RuleBuilder& then_require(Term s, Term p, Term o) {
        rule_.actions.push_back(Action::require(Pattern(std::move(s), std::move(p), std::move(o))));
        return *this;
    }

    Rule build() const {
        if (!error_.empty()) {
            throw LogicError(LogicErrorKind::InvalidRule, rule_.name + ": " + error_);
        }
        check_rule(rule_);
        return rule_;
    }

private:
    Rule rule_;
    std::string error_;
};

// ═══════════════════════════════════════════════════════════════════════════
// RuleSet: frozen, name-unique, ordered by priority (highest first)
// ═══════════════════════════════════════════════════════════════════════════

class RuleSet {
public:
    RuleSet() : rules_(std::make_shared<const std::vector<Rule>>()) {}

    const std::string& name() const { return name_; }
    const std::vector<Rule>& rules() const { return *rules_; }
    size_t size() const { return rules_->size(); }
    bool empty() const { return rules_->empty(); }

    const Rule* find(const std::string& rule_name) const {
        for (const auto& r : *rules_) {
            if (r.name == rule_name) return &r;
        }
        return nullptr;
    }

    std::vector<const Rule*> by_kind(RuleKind kind) const {
        std::vector<const Rule*> out;
        for (const auto& r : *rules_) {
            if (r.kind == kind) out.push_back(&r);
        }
        return out;
    }

    // New set with rule added, or replacing the rule of the same name
    RuleSet with_rule(Rule rule) const;

private:
    friend class RuleSetBuilder;

    std::string name_;
    std::shared_ptr<const std::vector<Rule>> rules_;
};

class RuleSetBuilder {
public:
    explicit RuleSetBuilder(std::string name = "default") : name_(std::move(name)) {}

    // Throws RuleConflict if a rule of the same name is already present
    RuleSetBuilder& add(Rule rule) {
        check_rule(rule);
        if (index_of(rule.name) >= 0) {
            throw LogicError(LogicErrorKind::RuleConflict, "duplicate rule name '" + rule.name + "'");
        }
        rules_.push_back(std::move(rule));
        return *this;
    }

    // Swaps out the rule of the same name; adds it when absent
    RuleSetBuilder& replace(Rule rule) {
        check_rule(rule);
        int idx = index_of(rule.name);
        if (idx >= 0) {
            rules_[static_cast<size_t>(idx)] = std::move(rule);
        } else {
            rules_.push_back(std::move(rule));
        }
        return *this;
    }

    RuleSetBuilder& add_all(const RuleSet& set) {
        for (const auto& r : set.rules()) add(r);
        return *this;
    }

    RuleSet build() const {
        auto sorted = rules_;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const Rule& a, const Rule& b) { return a.priority > b.priority; });
        RuleSet set;
        set.name_ = name_;
        set.rules_ = std::make_shared<const std::vector<Rule>>(std::move(sorted));
        return set;
    }

private:
    int index_of(const std::string& rule_name) const {
        for (size_t i = 0; i < rules_.size(); ++i) {
            if (rules_[i].name == rule_name) return static_cast<int>(i);
        }
        return -1;
    }

    std::string name_;
    std::vector<Rule> rules_;
};

inline RuleSet RuleSet::with_rule(Rule rule) const {
    RuleSetBuilder builder(name_);
    for (const auto& r : *rules_) builder.add(r);
    builder.replace(std::move(rule));
    return builder.build();
}

} // namespace nyaya
