#pragma once
// Built-in rule sets
//
// integrity_rules(): structural checks for the validator.
// semantic_rules():  common relational inferences (symmetry, inverses,
//                    class membership, transitive closure).

#include "rule.hpp"

namespace nyaya {

// What std::isspace accepts in the C locale
constexpr const char* WHITESPACE = " \t\n\v\f\r";

// (a p b), (b p c) => (a p c)
inline Rule transitive(const std::string& pred) {
    return RuleBuilder::inference("transitive_" + pred)
        .describe(pred + " is transitive")
        .when(var("a"), pred, var("b"))
        .when(var("b"), pred, var("c"))
        .then_assert(var("a"), pred, var("c"))
        .build();
}

// (a p b) => (b p a)
inline Rule symmetric(const std::string& pred) {
    return RuleBuilder::inference("symmetric_" + pred)
        .describe(pred + " is symmetric")
        .when(var("a"), pred, var("b"))
        .then_assert(var("b"), pred, var("a"))
        .build();
}

// (a p b) => (b q a)
inline Rule inverse(const std::string& p, const std::string& q) {
    return RuleBuilder::inference("inverse_" + p + "_" + q)
        .describe(q + " is the inverse of " + p)
        .when(var("a"), p, var("b"))
        .then_assert(var("b"), q, var("a"))
        .build();
}

inline RuleSet integrity_rules() {
    return RuleSetBuilder("integrity")
        .add(RuleBuilder::integrity("no_self_reference")
            .describe("a node may not point at itself")
            .severity(Severity::Warning)
            .when(var("x"), var("p"), var("x"))
            .then_reject("?x refers to itself through ?p")
            .build())
        .add(RuleBuilder::integrity("no_empty_predicate")
            .priority(10)
            .when(var("s"), var("p"), var("o"))
            .where("p", CompareOp::Eq, Value::node(""))
            .then_reject("empty predicate on ?s")
            .build())
        .add(RuleBuilder::integrity("no_empty_subject")
            .priority(10)
            .when(var("s"), var("p"), var("o"))
            .where("s", CompareOp::Eq, Value::node(""))
            .then_reject("empty subject name")
            .build())
        .add(RuleBuilder::integrity("no_whitespace_in_subject")
            .describe("named subjects are identifiers")
            .when(var("s"), var("p"), var("o"))
            .where("s", CompareOp::NameAnyOf, Value::string(WHITESPACE))
            .then_reject("subject ?s contains whitespace")
            .build())
        .add(RuleBuilder::integrity("no_whitespace_in_object_node")
            .describe("named objects are identifiers")
            .when(var("s"), var("p"), var("o"))
            .where("o", CompareOp::NameAnyOf, Value::string(WHITESPACE))
            .then_reject("object ?o of ?s contains whitespace")
            .build())
        .build();
}

inline RuleSet semantic_rules() {
    return RuleSetBuilder("semantic")
        .add(symmetric("married_to"))
        .add(inverse("parent_of", "child_of"))
        .add(RuleBuilder::inference("subclass_membership")
            .describe("members of a class are members of its superclasses")
            .when(var("x"), "type", var("c"))
            .when(var("c"), "subclass_of", var("d"))
            .then_assert(var("x"), "type", var("d"))
            .build())
        .add(transitive("subclass_of"))
        .add(RuleBuilder::inference("ancestor_base")
            .priority(1)
            .when(var("a"), "parent_of", var("b"))
            .then_assert(var("a"), "ancestor_of", var("b"))
            .build())
        .add(RuleBuilder::inference("ancestor_step")
            .when(var("a"), "parent_of", var("b"))
            .when(var("b"), "ancestor_of", var("c"))
            .then_assert(var("a"), "ancestor_of", var("c"))
            .build())
        .build();
}

} // namespace nyaya
