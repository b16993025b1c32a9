#include <nyaya/nyaya.hpp>
#include <iostream>
#include <algorithm>
#include <cassert>
#include <functional>
#include <set>
#include <thread>

using namespace nyaya;

Triple make(const std::string& s, const std::string& p, Value o) {
    return Triple(NodeId::named(s), Predicate(p), std::move(o));
}

std::unique_ptr<GraphStore> memory_store() {
    return std::make_unique<GraphStore>(std::make_unique<MemoryBackend>());
}

bool has(const std::vector<Triple>& v, const Triple& t) {
    return std::find(v.begin(), v.end(), t) != v.end();
}

template <typename F>
LogicErrorKind logic_error_kind(F&& f) {
    try {
        f();
    } catch (const LogicError& e) {
        return e.kind();
    }
    assert(false && "expected LogicError");
    return LogicErrorKind::GraphError;
}

void test_unify() {
    std::cout << "Testing unify..." << std::endl;

    Triple t = make("alice", "knows", Value::node("bob"));
    auto s = unify(Pattern(var("x"), "knows", var("y")), t);
    assert(s.has_value());
    assert(s->at("x") == Value::node("alice"));
    assert(s->at("y") == Value::node("bob"));

    // Same variable twice must bind the same value
    assert(!unify(Pattern(var("x"), var("p"), var("x")), t).has_value());
    assert(unify(Pattern(var("x"), var("p"), var("x")), make("a", "p", Value::node("a"))).has_value());

    // Predicate variables bind the named node of the predicate
    auto p = unify(Pattern(Term::any(), var("p"), Term::any()), t);
    assert(p && p->at("p") == Value::node("knows"));

    // Pre-bound variables constrain
    Substitution pre{{"y", Value::node("carol")}};
    assert(!unify(Pattern(var("x"), "knows", var("y")), t, pre).has_value());

    // Literal "bob" is not the node <bob>
    assert(!unify(Pattern(var("x"), "knows", lit(Value::string("bob"))), t).has_value());

    assert(instantiate(Pattern(var("y"), "known_by", var("x")), *s) ==
           make("bob", "known_by", Value::node("alice")));
    assert(logic_error_kind([&] { instantiate(Pattern(var("z"), "p", var("x")), *s); }) ==
           LogicErrorKind::UnificationFailed);

    // A literal cannot become a subject
    Substitution lit_subject{{"x", Value::string("text")}};
    assert(!try_instantiate(Pattern(var("x"), "p", node("o")), lit_subject).has_value());

    assert(render("?x knows ?y, not ?z", *s) == "<alice> knows <bob>, not ?z");

    std::cout << "  PASS" << std::endl;
}

void test_join() {
    std::cout << "Testing match_conditions..." << std::endl;

    auto store = memory_store();
    store->insert(make("alice", "knows", Value::node("bob")));
    store->insert(make("bob", "knows", Value::node("carol")));
    store->insert(make("alice", "knows", Value::node("dave")));
    store->insert(make("carol", "knows", Value::string("bob")));

    std::vector<Condition> two_hops = {
        {Pattern(var("a"), "knows", var("b")), std::nullopt},
        {Pattern(var("b"), "knows", var("c")), std::nullopt},
    };
    auto matches = match_conditions(*store, two_hops);
    std::set<std::pair<std::string, std::string>> ends;
    for (const auto& m : matches) {
        assert(m.premises.size() == 2);
        ends.emplace(m.bindings.at("a").to_string(), m.bindings.at("c").to_string());
    }
    assert(ends.size() == 2);
    assert(ends.count({"<alice>", "<carol>"}) == 1);
    assert(ends.count({"<bob>", "\"bob\""}) == 1);

    // Seeded with an initial binding
    auto from_bob = match_conditions(*store, two_hops, {{"a", Value::node("bob")}});
    assert(from_bob.size() == 1);

    auto none = match_conditions(*store, {{Pattern(var("a"), "hates", var("b")), std::nullopt}});
    assert(none.empty());

    std::cout << "  PASS" << std::endl;
}

void test_constraints() {
    std::cout << "Testing constraints..." << std::endl;

    auto store = memory_store();
    store->insert(make("alice", "age", Value::integer(30)));
    store->insert(make("bob", "age", Value::integer(17)));
    store->insert(make("carol", "age", Value::floating(18.5)));
    store->insert(make("dave", "age", Value::string("old")));

    Condition adult{Pattern(var("p"), "age", var("n")), Constraint{"n", CompareOp::Ge, Value::integer(18)}};
    auto adults = match_conditions(*store, {adult});
    std::set<std::string> names;
    for (const auto& m : adults) names.insert(m.bindings.at("p").as_node()->name);
    assert(names == std::set<std::string>({"alice", "carol"}));

    assert((Constraint{"n", CompareOp::Eq, Value::integer(3)}.holds(Value::floating(3.0))));
    assert((Constraint{"n", CompareOp::Ne, Value::string("a")}.holds(Value::string("b"))));
    assert((!Constraint{"n", CompareOp::Lt, Value::integer(3)}.holds(Value::string("2"))));
    assert((Constraint{"n", CompareOp::Lt, Value::string("b")}.holds(Value::string("a"))));
    assert((Constraint{"n", CompareOp::Prefix, Value::string("http://")}.holds(Value::node("http://x.org/a"))));
    assert((Constraint{"n", CompareOp::Contains, Value::string(" ")}.holds(Value::string("two words"))));
    assert((!Constraint{"n", CompareOp::Contains, Value::string(" ")}.holds(Value::integer(1))));

    Constraint spaced{"n", CompareOp::NameAnyOf, Value::string(" \t\n")};
    assert(spaced.holds(Value::node("tab\tname")));
    assert(spaced.holds(Value::node("line\nbreak")));
    assert(!spaced.holds(Value::node("plain")));
    assert(!spaced.holds(Value::string("not a node")));
    assert(!spaced.holds(Value::node(NodeId::blank())));
    assert(parse_compare_op("name_any_of") == CompareOp::NameAnyOf);

    std::cout << "  PASS" << std::endl;
}

void test_rule_builder_failures() {
    std::cout << "Testing rule builder failures..." << std::endl;

    auto invalid = [](std::function<Rule()> build) {
        return logic_error_kind([&] { build(); }) == LogicErrorKind::InvalidRule;
    };

    assert(invalid([] {
        return RuleBuilder::inference("").when(var("a"), "p", var("b")).then_assert(var("b"), "p", var("a")).build();
    }));
    assert(invalid([] {
        return RuleBuilder::inference("no_conditions").then_assert(node("a"), "p", node("b")).build();
    }));
    assert(invalid([] {
        return RuleBuilder::inference("no_actions").when(var("a"), "p", var("b")).build();
    }));
    assert(invalid([] {
        return RuleBuilder::inference("unbound").when(var("a"), "p", var("b")).then_assert(var("a"), "p", var("c")).build();
    }));
    assert(invalid([] {
        return RuleBuilder::inference("wildcard").when(var("a"), "p", var("b")).then_assert(var("a"), "q", Term::any()).build();
    }));
    assert(invalid([] {
        return RuleBuilder::inference("literal_subject").when(var("a"), "p", var("b"))
            .then_assert(lit(Value::integer(1)), "q", var("a")).build();
    }));
    assert(invalid([] {
        return RuleBuilder::constraint("late_constraint").when(var("a"), "p", var("b"))
            .where("c", CompareOp::Eq, Value::integer(1)).then_reject("x").build();
    }));
    assert(invalid([] {
        return RuleBuilder::constraint("where_first").where("a", CompareOp::Eq, Value::integer(1))
            .when(var("a"), "p", var("b")).then_reject("x").build();
    }));

    Rule r = symmetric("knows");
    assert(logic_error_kind([&] { RuleSetBuilder().add(r).add(r); }) == LogicErrorKind::RuleConflict);

    RuleSet set = RuleSetBuilder().add(r).add(inverse("parent_of", "child_of")).build();
    Rule disabled = r;
    disabled.enabled = false;
    RuleSet replaced = set.with_rule(disabled);
    assert(replaced.size() == 2);
    assert(!replaced.find("symmetric_knows")->enabled);
    assert(set.find("symmetric_knows")->enabled);

    // Priority order, highest first
    RuleSet ordered = RuleSetBuilder()
        .add(RuleBuilder::inference("low").when(var("a"), "p", var("b")).then_assert(var("b"), "p", var("a")).build())
        .add(RuleBuilder::inference("high").priority(5).when(var("a"), "q", var("b")).then_assert(var("b"), "q", var("a")).build())
        .build();
    assert(ordered.rules().front().name == "high");

    std::cout << "  PASS" << std::endl;
}

void test_forward_fixpoint() {
    std::cout << "Testing forward chaining fixpoint..." << std::endl;

    auto store = memory_store();
    store->insert(make("tom", "parent_of", Value::node("bob")));
    store->insert(make("bob", "parent_of", Value::node("ann")));
    store->insert(make("alice", "married_to", Value::node("tom")));
    store->insert(make("rex", "type", Value::node("dog")));
    store->insert(make("dog", "subclass_of", Value::node("mammal")));
    store->insert(make("mammal", "subclass_of", Value::node("animal")));

    InferenceEngine engine(*store);
    auto derived = engine.infer_forward(semantic_rules());

    assert(has(derived, make("bob", "child_of", Value::node("tom"))));
    assert(has(derived, make("ann", "child_of", Value::node("bob"))));
    assert(has(derived, make("tom", "married_to", Value::node("alice"))));
    assert(has(derived, make("tom", "ancestor_of", Value::node("ann"))));
    assert(has(derived, make("dog", "subclass_of", Value::node("animal"))));
    assert(has(derived, make("rex", "type", Value::node("animal"))));
    assert(store->count() == 6 + derived.size());

    auto again = engine.infer_forward(semantic_rules());
    assert(again.empty());
    assert(engine.stats().forward_runs == 2);

    std::cout << "  PASS" << std::endl;
}

void test_forward_loop_guard() {
    std::cout << "Testing forward chaining loop guard..." << std::endl;

    auto store = memory_store();
    for (int i = 0; i < 6; ++i) {
        store->insert(make("n" + std::to_string(i), "next", Value::node("n" + std::to_string(i + 1))));
    }
    RuleSet rules = RuleSetBuilder().add(transitive("next")).build();

    InferenceEngine engine(*store);
    assert(logic_error_kind([&] { engine.infer_forward(rules, 1); }) == LogicErrorKind::InferenceLoop);

    // Partial progress is kept and finishing later is safe
    size_t partial = store->count();
    assert(partial > 6);
    engine.infer_forward(rules);
    assert(store->count() == 6 + 5 + 4 + 3 + 2 + 1);

    // A rule that re-asserts a permutation of its premise still terminates
    auto sym = memory_store();
    sym->insert(make("a", "near", Value::node("b")));
    InferenceEngine sym_engine(*sym, EngineConfig{4, 8});
    assert(sym_engine.infer_forward(RuleSetBuilder().add(symmetric("near")).build()).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_query_derived() {
    std::cout << "Testing query_derived..." << std::endl;

    auto store = memory_store();
    store->insert(make("tom", "parent_of", Value::node("bob")));
    InferenceEngine engine(*store);

    auto children = engine.query_derived(TriplePattern::any().with_predicate(Predicate("child_of")),
                                         semantic_rules());
    assert(children.size() == 1);
    assert(children[0] == make("bob", "child_of", Value::node("tom")));
    assert(store->count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_prove_and_verify() {
    std::cout << "Testing prove/verify..." << std::endl;

    auto store = memory_store();
    Triple tb = make("tom", "parent_of", Value::node("bob"));
    Triple ba = make("bob", "parent_of", Value::node("ann"));
    store->insert(tb);
    store->insert(ba);
    RuleSet rules = semantic_rules();
    InferenceEngine engine(*store);
    ProofVerifier verifier(rules);

    Triple goal = make("tom", "ancestor_of", Value::node("ann"));
    LogicProof proof = engine.prove(TriplePattern::exact(goal), rules);
    assert(proof.conclusion == goal);
    assert(proof.steps.size() == 2);
    assert(proof.depth() == 2);
    assert(proof.steps[0].rule_name == "ancestor_base");
    assert(proof.steps[0].premises.size() == 1 && proof.steps[0].premises[0] == triple_id(ba));
    assert(proof.steps[1].rule_name == "ancestor_step");
    assert(proof.steps[1].premises[0] == triple_id(tb));
    verifier.verify(proof, *store);

    // Proving does not write
    assert(store->count() == 2);

    // A stored fact needs no steps
    LogicProof fact = engine.prove(TriplePattern::exact(tb), rules);
    assert(fact.is_fact() && fact.conclusion == tb);
    verifier.verify(fact, *store);

    // Open goal: any ancestor of someone, starting from tom
    LogicProof open = engine.prove(TriplePattern::any().with_subject(NodeId::named("tom"))
                                                       .with_predicate(Predicate("ancestor_of")), rules);
    assert(open.conclusion.subject == NodeId::named("tom"));
    assert(open.conclusion.predicate == Predicate("ancestor_of"));
    verifier.verify(open, *store);

    // Removing a premise invalidates the proof
    store->remove(triple_id(ba));
    assert(logic_error_kind([&] { verifier.verify(proof, *store); }) == LogicErrorKind::InvalidProof);
    std::string why;
    assert(!verifier.check(proof, *store, &why));
    assert(why.find("step 1") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_prove_failures() {
    std::cout << "Testing prove failures..." << std::endl;

    auto store = memory_store();
    for (int i = 0; i < 5; ++i) {
        store->insert(make("n" + std::to_string(i), "parent_of", Value::node("n" + std::to_string(i + 1))));
    }
    RuleSet rules = semantic_rules();
    InferenceEngine engine(*store);
    TriplePattern far = TriplePattern::exact(make("n0", "ancestor_of", Value::node("n5")));

    // Nothing establishes the reverse direction
    assert(logic_error_kind([&] {
        engine.prove(TriplePattern::exact(make("n5", "ancestor_of", Value::node("n0"))), rules);
    }) == LogicErrorKind::MissingPrecondition);

    // Depth guard
    try {
        engine.prove(far, rules, 2);
        assert(false);
    } catch (const LogicError& e) {
        assert(e.kind() == LogicErrorKind::MaxDepthExceeded);
        assert(e.depth() == 2);
    }

    LogicProof deep = engine.prove(far, rules, 5);
    assert(deep.steps.size() == 5);
    assert(deep.depth() == 5);
    ProofVerifier(rules).verify(deep, *store);

    // Left recursion with no base case is cut, not followed forever
    RuleSet left = RuleSetBuilder()
        .add(RuleBuilder::inference("reach_left")
            .when(var("a"), "reach", var("b"))
            .when(var("b"), "edge", var("c"))
            .then_assert(var("a"), "reach", var("c"))
            .build())
        .build();
    assert(logic_error_kind([&] {
        engine.prove(TriplePattern::exact(make("x", "reach", Value::node("y"))), left);
    }) == LogicErrorKind::InferenceLoop);

    assert(engine.stats().prove_calls == 4);

    std::cout << "  PASS" << std::endl;
}

void test_tampered_proofs() {
    std::cout << "Testing tampered proofs..." << std::endl;

    auto store = memory_store();
    store->insert(make("tom", "parent_of", Value::node("bob")));
    store->insert(make("bob", "parent_of", Value::node("ann")));
    RuleSet rules = semantic_rules();
    InferenceEngine engine(*store);
    ProofVerifier verifier(rules);

    LogicProof good = engine.prove(TriplePattern::exact(make("tom", "ancestor_of", Value::node("ann"))), rules);
    assert(verifier.check(good, *store));

    LogicProof wrong_conclusion = good;
    wrong_conclusion.conclusion = make("tom", "ancestor_of", Value::node("bob"));
    assert(!verifier.check(wrong_conclusion, *store));

    LogicProof wrong_derived = good;
    wrong_derived.steps.back().derived = make("tom", "ancestor_of", Value::node("zed"));
    wrong_derived.conclusion = wrong_derived.steps.back().derived;
    assert(!verifier.check(wrong_derived, *store));

    LogicProof unknown_rule = good;
    unknown_rule.steps[0].rule_name = "made_up";
    assert(!verifier.check(unknown_rule, *store));

    LogicProof missing_premise = good;
    missing_premise.steps[0].premises[0] = triple_id(make("eve", "parent_of", Value::node("ann")));
    assert(!verifier.check(missing_premise, *store));

    LogicProof wrong_arity = good;
    wrong_arity.steps[1].premises.pop_back();
    assert(!verifier.check(wrong_arity, *store));

    LogicProof reordered = good;
    std::swap(reordered.steps[0], reordered.steps[1]);
    assert(!verifier.check(reordered, *store));

    LogicProof claimed_fact;
    claimed_fact.conclusion = make("tom", "ancestor_of", Value::node("ann"));
    assert(!verifier.check(claimed_fact, *store));

    Rule switched_off = *rules.find("ancestor_base");
    switched_off.enabled = false;
    std::string why;
    assert(!ProofVerifier(rules.with_rule(switched_off)).check(good, *store, &why));
    assert(why.find("disabled") != std::string::npos);
    assert(logic_error_kind([&] {
        ProofVerifier(rules.with_rule(switched_off)).verify(good, *store);
    }) == LogicErrorKind::InvalidProof);

    assert(good.digest() != wrong_derived.digest());

    std::cout << "  PASS" << std::endl;
}

void test_functional_contradiction() {
    std::cout << "Testing functional predicates..." << std::endl;

    auto store = memory_store();
    store->insert(make("alice", "age", Value::integer(30)));
    ValidatorConfig config;
    config.functional_predicates.insert("age");
    Validator validator(*store, config);
    RuleSet empty;

    auto conflict = validator.validate(make("alice", "age", Value::integer(31)), empty);
    assert(!conflict.valid);
    assert(conflict.error_count(Severity::Fatal) == 1);
    assert(conflict.errors[0].rule_name == "functional:age");
    assert(logic_error_kind([&] { conflict.throw_if_invalid(); }) == LogicErrorKind::Contradiction);

    auto same = validator.validate(make("alice", "age", Value::integer(30)), empty);
    assert(same.valid && same.errors.empty());

    auto other = validator.validate(make("bob", "age", Value::integer(31)), empty);
    assert(other.valid);

    // Conflicts inside a batch count too
    auto batch = validator.validate(std::vector<Triple>{make("bob", "age", Value::integer(1)),
                                                        make("bob", "age", Value::integer(2))}, empty);
    assert(!batch.valid);
    assert(batch.error_count(Severity::Fatal) >= 1);

    // Validation does not insert
    assert(store->count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_exclusive_and_temporal() {
    std::cout << "Testing exclusive and temporal checks..." << std::endl;

    auto store = memory_store();
    store->insert(make("cat", "alive", Value::boolean(true)));
    store->insert(make("a", "before", Value::node("b")));
    store->insert(make("b", "before", Value::node("c")));

    ValidatorConfig config;
    config.exclusive_pairs.emplace_back("alive", "dead");
    Validator validator(*store, config);
    RuleSet empty;

    auto dead = validator.validate(make("cat", "dead", Value::boolean(true)), empty);
    assert(!dead.valid && dead.error_count(Severity::Error) == 1);
    assert(validator.validate(make("dog", "dead", Value::boolean(true)), empty).valid);

    auto cycle = validator.validate(make("c", "before", Value::node("a")), empty);
    assert(!cycle.valid);
    assert(cycle.errors[0].rule_name == "temporal:before");
    assert(validator.validate(make("a", "before", Value::node("c")), empty).valid);
    assert(!validator.validate(make("d", "before", Value::node("d")), empty).valid);

    ValidationResult merged;
    merged.merge(dead);
    merged.merge(cycle);
    merged.merge(dead);
    assert(merged.errors.size() == 2);
    assert(logic_error_kind([&] { merged.throw_if_invalid(); }) == LogicErrorKind::ValidationFailed);

    std::cout << "  PASS" << std::endl;
}

void test_check_contradictions() {
    std::cout << "Testing check_contradictions..." << std::endl;

    auto store = memory_store();
    store->insert(make("alice", "age", Value::integer(30)));
    store->insert(make("alice", "age", Value::integer(31)));
    store->insert(make("x", "before", Value::node("y")));
    store->insert(make("y", "before", Value::node("x")));
    store->insert(make("cat", "alive", Value::boolean(true)));
    store->insert(make("cat", "dead", Value::boolean(true)));
    store->insert(make("bob", "age", Value::integer(40)));

    ValidatorConfig config;
    config.functional_predicates.insert("age");
    config.exclusive_pairs.emplace_back("alive", "dead");
    auto found = Validator(*store, config).check_contradictions();
    assert(found.size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_rule_validation() {
    std::cout << "Testing rule-based validation..." << std::endl;

    auto store = memory_store();
    Validator validator(*store);
    RuleSet integrity = integrity_rules();

    auto self = validator.validate(make("x", "likes", Value::node("x")), integrity);
    assert(self.valid);
    assert(self.error_count(Severity::Warning) == 1);

    auto spaced = validator.validate(make("bad name", "likes", Value::node("x")), integrity);
    assert(!spaced.valid);
    assert(spaced.errors[0].rule_name == "no_whitespace_in_subject");

    for (const char* name : {"tab\tname", "line\nname", "cr\rname", "ff\fname"}) {
        auto r = validator.validate(make(name, "likes", Value::node("x")), integrity);
        assert(!r.valid);
        assert(r.errors[0].rule_name == "no_whitespace_in_subject");
    }

    auto spaced_object = validator.validate(make("x", "likes", Value::node("y z")), integrity);
    assert(!spaced_object.valid);
    assert(spaced_object.errors.size() == 1);
    assert(spaced_object.errors[0].rule_name == "no_whitespace_in_object_node");

    assert(validator.validate(make("x", "says", Value::string("two words")), integrity).valid);

    RuleSet policy = RuleSetBuilder("policy")
        .add(RuleBuilder::authority("documents_need_owner")
            .when(var("d"), "type", node("document"))
            .then_require(var("d"), "owner", Term::any())
            .build())
        .add(RuleBuilder::constraint("non_negative_age")
            .severity(Severity::Fatal)
            .when(var("p"), "age", var("n"))
            .where("n", CompareOp::Lt, Value::integer(0))
            .then_reject("negative age ?n for ?p")
            .build())
        .add(RuleBuilder::inference("ignored_by_validation")
            .when(var("a"), "type", var("b"))
            .then_reject("inference rules are not validation rules")
            .build())
        .build();

    Triple doc = make("doc1", "type", Value::node("document"));
    auto orphan = validator.validate(doc, policy);
    assert(!orphan.valid);
    assert(orphan.errors.size() == 1 && orphan.errors[0].rule_name == "documents_need_owner");

    store->insert(make("doc1", "owner", Value::node("bob")));
    assert(validator.validate(doc, policy).valid);

    // The requirement can also be met by the same batch
    auto batch = validator.validate(std::vector<Triple>{make("doc2", "type", Value::node("document")),
                                                        make("doc2", "owner", Value::node("eve"))}, policy);
    assert(batch.valid);

    auto negative = validator.validate(make("bob", "age", Value::integer(-5)), policy);
    assert(!negative.valid);
    assert(negative.errors[0].message == "negative age -5 for <bob>");
    assert(negative.errors[0].severity == Severity::Fatal);
    assert(validator.validate(make("bob", "age", Value::integer(5)), policy).valid);

    std::cout << "  PASS" << std::endl;
}

void test_scenario() {
    std::cout << "Testing validate scenario..." << std::endl;

    auto store = memory_store();
    Triple t = make("alice", "knows", Value::node("bob"));
    TripleId id = store->insert(t);
    auto hits = store->find(TriplePattern::any().with_subject(NodeId::named("alice")));
    assert(hits.size() == 1 && hits[0] == t);
    store->remove(id);
    assert(store->find(TriplePattern::any().with_subject(NodeId::named("alice"))).empty());

    auto result = Validator(*store).validate(make("alice", "likes", Value::string("pizza")), RuleSet());
    assert(result.valid);
    assert(result.errors.empty());

    std::cout << "  PASS" << std::endl;
}

void test_json_rules() {
    std::cout << "Testing rule JSON..." << std::endl;

    for (const RuleSet& set : {semantic_rules(), integrity_rules()}) {
        json j = rules_to_json(set);
        RuleSet back = rules_from_json(json::parse(j.dump()));
        assert(back.size() == set.size());
        assert(back.name() == set.name());
        for (const auto& r : set.rules()) {
            assert(back.find(r.name));
            assert(rule_to_json(*back.find(r.name)) == rule_to_json(r));
        }
    }

    RuleSet parsed = rules_from_json(json::parse(R"([
        {"name": "likes_back", "kind": "inference",
         "conditions": [{"when": ["?a", "likes", "?b"]}],
         "actions": [{"kind": "assert", "pattern": ["?b", "liked_by", "?a"]}]},
        {"name": "adult", "kind": "constraint", "severity": "warning",
         "conditions": [{"when": ["?p", "age", "?n"], "where": {"variable": "?n", "op": "<", "value": 18}}],
         "actions": [{"kind": "reject", "reason": "?p is a minor"}]}
    ])"));
    assert(parsed.size() == 2);
    const Rule* adult = parsed.find("adult");
    assert(adult && adult->severity == Severity::Warning);
    assert(adult->conditions[0].constraint->variable == "n");
    assert(adult->conditions[0].pattern.predicate == Term("age"));

    // Reserved-looking strings survive as literals
    assert(value_from_json(value_to_json(Value::string("?x"))) == Value::string("?x"));
    assert(value_from_json(value_to_json(Value::string("<b>"))) == Value::string("<b>"));
    assert(value_from_json(value_to_json(Value::floating(2.0))) == Value::floating(2.0));

    assert(logic_error_kind([] { rules_from_json(json::parse(R"({"rules": [{"kind": "inference"}]})")); }) ==
           LogicErrorKind::SerializationError);
    assert(logic_error_kind([] { rules_from_json(json::parse(R"([{"name": "x", "conditions": "no", "actions": []}])")); }) ==
           LogicErrorKind::SerializationError);
    assert(logic_error_kind([] {
        rules_from_json(json::parse(R"([{"name": "x", "conditions": [{"when": ["?a", "p", "?b"]}],
                                         "actions": [{"kind": "assert", "pattern": ["?a", "p", "?c"]}]}])"));
    }) == LogicErrorKind::InvalidRule);

    std::cout << "  PASS" << std::endl;
}

void test_json_proofs() {
    std::cout << "Testing proof JSON..." << std::endl;

    auto store = memory_store();
    store->insert(make("tom", "parent_of", Value::node("bob")));
    store->insert(make("bob", "parent_of", Value::node("ann")));
    RuleSet rules = semantic_rules();
    LogicProof proof = InferenceEngine(*store).prove(
        TriplePattern::exact(make("tom", "ancestor_of", Value::node("ann"))), rules);

    json j = proof_to_json(proof);
    LogicProof back = proof_from_json(json::parse(j.dump()));
    assert(back.digest() == proof.digest());
    assert(back.conclusion == proof.conclusion);
    ProofVerifier(rules).verify(back, *store);

    json edited = j;
    edited["steps"][0]["rule"] = "ancestor_step";
    assert(logic_error_kind([&] { proof_from_json(edited); }) == LogicErrorKind::InvalidProof);

    json broken = j;
    broken["steps"][0]["premises"][0] = "zz";
    assert(logic_error_kind([&] { proof_from_json(broken); }) == LogicErrorKind::SerializationError);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_forward() {
    std::cout << "Testing concurrent forward chaining..." << std::endl;

    auto seed = [](GraphStore& store) {
        for (int i = 0; i < 8; ++i) {
            store.insert(make("p" + std::to_string(i), "parent_of", Value::node("p" + std::to_string(i + 1))));
        }
        store.insert(make("p0", "married_to", Value::node("q0")));
    };

    auto reference = memory_store();
    seed(*reference);
    InferenceEngine(*reference).infer_forward(semantic_rules());

    auto shared = memory_store();
    seed(*shared);
    InferenceEngine engine(*shared);
    RuleSet rules = semantic_rules();
    std::vector<std::thread> threads;
    std::vector<size_t> derived(4, 0);
    for (size_t w = 0; w < derived.size(); ++w) {
        threads.emplace_back([&, w]() { derived[w] = engine.infer_forward(rules).size(); });
    }
    for (auto& t : threads) t.join();

    size_t total = 0;
    for (size_t n : derived) total += n;
    assert(shared->count() == reference->count());
    assert(total == reference->count() - 9);
    assert(engine.infer_forward(rules).empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Nyaya Logic Tests ===" << std::endl;

    test_unify();
    test_join();
    test_constraints();
    test_rule_builder_failures();

    std::cout << std::endl;
    std::cout << "=== Inference ===" << std::endl;
    test_forward_fixpoint();
    test_forward_loop_guard();
    test_query_derived();
    test_prove_and_verify();
    test_prove_failures();
    test_tampered_proofs();

    std::cout << std::endl;
    std::cout << "=== Validation ===" << std::endl;
    test_functional_contradiction();
    test_exclusive_and_temporal();
    test_check_contradictions();
    test_rule_validation();
    test_scenario();

    std::cout << std::endl;
    std::cout << "=== JSON ===" << std::endl;
    test_json_rules();
    test_json_proofs();

    std::cout << std::endl;
    std::cout << "=== Concurrency ===" << std::endl;
    test_concurrent_forward();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
