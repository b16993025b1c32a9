#pragma once
// Inference: forward chaining to a fixpoint, backward chaining to a proof
//
// Forward: sweep every enabled rule over the store, insert what its Assert
// actions produce, stop when a sweep adds nothing. Inserts are idempotent,
// so concurrent or interrupted runs are safe to repeat.
//
// Backward: SLD resolution over an explicit stack of branches. A branch is
// a stack of goal frames plus its own bindings; choosing an alternative
// copies the branch, so nothing is shared between alternatives. Each frame
// carries the goals in flight above it (an immutable list), and a goal that
// recurs on its own path is cut. Stored facts are tried before rules.

#include "proof.hpp"
#include <atomic>

namespace nyaya {

struct EngineConfig {
    size_t max_iterations = 64;   // forward sweeps before InferenceLoop
    size_t max_depth = 32;        // nested rule applications in prove()
};

struct EngineStats {
    uint64_t forward_runs = 0;
    uint64_t iterations = 0;
    uint64_t rules_fired = 0;
    uint64_t triples_derived = 0;
    uint64_t prove_calls = 0;
    uint64_t goals_expanded = 0;
};

namespace detail {

// Bindings for one branch. Besides values, two unbound variables can be
// aliased (a goal variable meeting a rule variable); root() picks the
// representative.
class Bindings {
public:
    std::string root(const std::string& v) const {
        std::string cur = v;
        for (auto it = alias_.find(cur); it != alias_.end(); it = alias_.find(cur)) {
            cur = it->second;
        }
        return cur;
    }

    bool bind(const std::string& v, const Value& value) {
        auto [it, inserted] = values_.emplace(root(v), value);
        return inserted || it->second == value;
    }

    bool join(const std::string& a, const std::string& b) {
        std::string ra = root(a), rb = root(b);
        if (ra == rb) return true;
        auto va = values_.find(ra);
        auto vb = values_.find(rb);
        if (va != values_.end() && vb != values_.end()) return va->second == vb->second;
        alias_[ra] = rb;
        if (va != values_.end()) {
            values_[rb] = va->second;
            values_.erase(ra);
        }
        return true;
    }

    Term resolve(const Term& t) const {
        if (!t.is_var()) return t;
        std::string r = root(t.variable);
        auto it = values_.find(r);
        if (it != values_.end()) return Term(it->second);
        return Term::var(r);
    }

    Pattern resolve(const Pattern& p) const {
        return Pattern(resolve(p.subject), resolve(p.predicate), resolve(p.object));
    }

    bool holds(const std::optional<Constraint>& c) const {
        if (!c) return true;
        Term t = resolve(Term::var(c->variable));
        return t.is_constant() && c->holds(t.constant);
    }

private:
    std::map<std::string, Value> values_;
    std::map<std::string, std::string> alias_;
};

inline bool unify_terms(const Term& a, const Term& b, Bindings& bs) {
    Term x = bs.resolve(a);
    Term y = bs.resolve(b);
    if (x.is_any() || y.is_any()) return true;
    if (x.is_constant() && y.is_constant()) return x.constant == y.constant;
    if (x.is_var() && y.is_var()) return bs.join(x.variable, y.variable);
    if (x.is_var()) return bs.bind(x.variable, y.constant);
    return bs.bind(y.variable, x.constant);
}

inline bool unify_patterns(const Pattern& a, const Pattern& b, Bindings& bs) {
    return unify_terms(a.subject, b.subject, bs) &&
           unify_terms(a.predicate, b.predicate, bs) &&
           unify_terms(a.object, b.object, bs);
}

inline Pattern fact_pattern(const Triple& t) {
    return Pattern(Term(t.subject), Term(predicate_value(t.predicate)), Term(t.object));
}

// Identity of a goal for loop detection: variables numbered by first use
inline std::string goal_key(const Pattern& resolved) {
    std::map<std::string, size_t> numbering;
    std::string key;
    for (const Term* t : {&resolved.subject, &resolved.predicate, &resolved.object}) {
        if (t->is_var()) {
            auto [it, inserted] = numbering.emplace(t->variable, numbering.size());
            key += "?" + std::to_string(it->second);
        } else {
            key += t->to_string();
        }
        key += '\x1f';
    }
    return key;
}

inline Term rename(const Term& t, const std::string& suffix) {
    return t.is_var() ? Term::var(t.variable + suffix) : t;
}

inline Pattern rename(const Pattern& p, const std::string& suffix) {
    return Pattern(rename(p.subject, suffix), rename(p.predicate, suffix), rename(p.object, suffix));
}

// Goals being solved above a frame, innermost first
struct InFlight {
    std::string key;
    std::shared_ptr<const InFlight> parent;
};
using InFlightPtr = std::shared_ptr<const InFlight>;

inline bool in_flight(const InFlightPtr& path, const std::string& key) {
    for (const InFlight* p = path.get(); p; p = p->parent.get()) {
        if (p->key == key) return true;
    }
    return false;
}

struct GoalFrame {
    enum class Kind : uint8_t {
        Solve = 0,    // find a triple matching pattern
        Derive = 1,   // all conditions of a rule are solved; emit its head
    };

    Kind kind = Kind::Solve;
    Pattern pattern;                        // Solve: goal, Derive: renamed head
    std::optional<Constraint> constraint;   // constraint of the goal being satisfied
    size_t depth = 0;
    InFlightPtr in_flight;
    std::string rule_name;                  // Derive
    size_t premise_count = 0;               // Derive
};

struct Branch {
    std::vector<GoalFrame> goals;           // back() runs next
    Bindings bindings;
    std::vector<Triple> results;            // solved goals awaiting their Derive
    std::vector<ProofStep> steps;
    size_t fresh = 0;
};

} // namespace detail

class InferenceEngine {
public:
    explicit InferenceEngine(GraphStore& store, EngineConfig config = {})
        : store_(store), config_(config) {}

    const EngineConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Forward chaining
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<Triple> infer_forward(const RuleSet& rules) {
        return infer_forward(rules, config_.max_iterations);
    }

    // Newly derived triples, in derivation order
    std::vector<Triple> infer_forward(const RuleSet& rules, size_t max_iterations) {
        ++forward_runs_;
        std::vector<Triple> derived;

        for (size_t iteration = 1;; ++iteration) {
            if (iteration > max_iterations) {
                throw LogicError(LogicErrorKind::InferenceLoop,
                                 "no fixpoint after " + std::to_string(max_iterations) +
                                 " iterations (" + std::to_string(derived.size()) + " triples derived)");
            }
            ++iterations_;

            size_t added = 0;
            for (const auto& rule : rules.rules()) {
                if (!rule.enabled || !rule.has_assert()) continue;

                auto matches = match_conditions(store_, rule.conditions);
                for (const auto& m : matches) {
                    ++rules_fired_;
                    for (const auto& action : rule.actions) {
                        if (action.kind != Action::Kind::Assert) continue;
                        auto t = try_instantiate(action.pattern, m.bindings);
                        if (!t) {
                            log_debug("Inference", "%s: %s not a valid triple under its bindings",
                                      rule.name.c_str(), action.pattern.to_string().c_str());
                            continue;
                        }
                        if (insert(*t)) {
                            derived.push_back(std::move(*t));
                            ++added;
                        }
                    }
                }
            }

            log_debug("Inference", "iteration %zu: %zu new triples", iteration, added);
            if (added == 0) break;
        }

        triples_derived_ += derived.size();
        return derived;
    }

    // Stored triples plus everything the rules derive from them, without
    // touching the store (forward chaining runs on an in-memory copy)
    std::vector<Triple> query_derived(const TriplePattern& pattern, const RuleSet& rules) const {
        GraphStore scratch(std::make_unique<MemoryBackend>());
        scratch.insert_batch(store_.find(TriplePattern::any()));
        InferenceEngine(scratch, config_).infer_forward(rules);
        return scratch.find(pattern);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Backward chaining
    // ═══════════════════════════════════════════════════════════════════════

    LogicProof prove(const TriplePattern& goal, const RuleSet& rules) const {
        return prove(goal, rules, config_.max_depth);
    }

    // Throws MaxDepthExceeded, InferenceLoop or MissingPrecondition when no
    // branch succeeds (in that order of precedence)
    LogicProof prove(const TriplePattern& goal, const RuleSet& rules, size_t max_depth) const {
        using detail::Branch;
        using detail::GoalFrame;

        ++prove_calls_;

        Pattern root(goal.subject ? Term(*goal.subject) : Term::any(),
                     goal.predicate ? Term(predicate_value(*goal.predicate)) : Term::any(),
                     goal.object ? Term(*goal.object) : Term::any());

        Branch initial;
        GoalFrame top;
        top.pattern = root;
        initial.goals.push_back(std::move(top));

        std::vector<Branch> stack;
        stack.push_back(std::move(initial));
        bool depth_cut = false;
        bool loop_cut = false;

        while (!stack.empty()) {
            Branch branch = std::move(stack.back());
            stack.pop_back();

            if (branch.goals.empty()) {
                LogicProof proof;
                proof.conclusion = branch.results.back();
                proof.steps = std::move(branch.steps);
                log_debug("Inference", "%s: proved in %zu steps",
                          goal.to_string().c_str(), proof.steps.size());
                return proof;
            }

            GoalFrame frame = std::move(branch.goals.back());
            branch.goals.pop_back();

            if (frame.kind == GoalFrame::Kind::Derive) {
                if (complete_derivation(branch, frame)) stack.push_back(std::move(branch));
                continue;
            }

            Pattern resolved = branch.bindings.resolve(frame.pattern);
            std::string key = detail::goal_key(resolved);
            if (detail::in_flight(frame.in_flight, key)) {
                loop_cut = true;
                continue;
            }
            ++goals_expanded_;

            std::vector<Branch> alternatives;

            // Stored facts
            auto query = to_query(resolved, {});
            if (query) {
                auto facts = store_.find(*query);
                std::sort(facts.begin(), facts.end());
                for (const auto& fact : facts) {
                    Branch next = branch;
                    if (!detail::unify_patterns(frame.pattern, detail::fact_pattern(fact), next.bindings)) continue;
                    if (!next.bindings.holds(frame.constraint)) continue;
                    next.results.push_back(fact);
                    alternatives.push_back(std::move(next));
                }
            }

            // Rules whose Assert could produce the goal
            auto path = std::make_shared<const detail::InFlight>(detail::InFlight{key, frame.in_flight});
            for (const auto& rule : rules.rules()) {
                if (!rule.enabled) continue;
                for (const auto& action : rule.actions) {
                    if (action.kind != Action::Kind::Assert) continue;

                    Branch next = branch;
                    std::string suffix = "#" + std::to_string(next.fresh++);
                    Pattern head = detail::rename(action.pattern, suffix);
                    if (!detail::unify_patterns(frame.pattern, head, next.bindings)) continue;

                    if (frame.depth >= max_depth) {
                        depth_cut = true;
                        continue;
                    }

                    GoalFrame derive;
                    derive.kind = GoalFrame::Kind::Derive;
                    derive.pattern = head;
                    derive.constraint = frame.constraint;
                    derive.depth = frame.depth;
                    derive.rule_name = rule.name;
                    derive.premise_count = rule.conditions.size();
                    next.goals.push_back(std::move(derive));

                    for (size_t i = rule.conditions.size(); i-- > 0;) {
                        const auto& cond = rule.conditions[i];
                        GoalFrame sub;
                        sub.pattern = detail::rename(cond.pattern, suffix);
                        if (cond.constraint) {
                            Constraint c = *cond.constraint;
                            c.variable += suffix;
                            sub.constraint = std::move(c);
                        }
                        sub.depth = frame.depth + 1;
                        sub.in_flight = path;
                        next.goals.push_back(std::move(sub));
                    }
                    alternatives.push_back(std::move(next));
                }
            }

            // Reverse so the first alternative (facts before rules) runs first
            for (auto it = alternatives.rbegin(); it != alternatives.rend(); ++it) {
                stack.push_back(std::move(*it));
            }
        }

        if (depth_cut) throw LogicError::max_depth(max_depth);
        if (loop_cut) {
            throw LogicError(LogicErrorKind::InferenceLoop,
                             goal.to_string() + " only recurs into itself");
        }
        throw LogicError(LogicErrorKind::MissingPrecondition,
                         "no stored fact or rule establishes " + goal.to_string());
    }

    EngineStats stats() const {
        EngineStats s;
        s.forward_runs = forward_runs_;
        s.iterations = iterations_;
        s.rules_fired = rules_fired_;
        s.triples_derived = triples_derived_;
        s.prove_calls = prove_calls_;
        s.goals_expanded = goals_expanded_;
        return s;
    }

private:
    // true if this call stored the triple. Invalid derived triples surface as
    // LogicError; storage failures propagate as they are.
    bool insert(const Triple& t) {
        try {
            return store_.insert_checked(t).second;
        } catch (const GraphError& e) {
            if (e.kind() == GraphErrorKind::InvalidTriple) throw LogicError::wrap(e);
            throw;
        }
    }

    // Pops the rule's premises, records the step, pushes the derived triple.
    // false if the derived triple violates the goal's constraint.
    static bool complete_derivation(detail::Branch& branch, const detail::GoalFrame& frame) {
        auto derived = try_instantiate(branch.bindings.resolve(frame.pattern), {});
        if (!derived || !branch.bindings.holds(frame.constraint)) return false;
        if (branch.results.size() < frame.premise_count) return false;

        ProofStep step;
        step.rule_name = frame.rule_name;
        auto first = branch.results.end() - static_cast<std::ptrdiff_t>(frame.premise_count);
        for (auto it = first; it != branch.results.end(); ++it) {
            step.premises.push_back(triple_id(*it));
        }
        branch.results.erase(first, branch.results.end());
        step.derived = *derived;

        bool known = std::any_of(branch.steps.begin(), branch.steps.end(),
            [&](const ProofStep& s) { return s.derived == step.derived; });
        if (!known) branch.steps.push_back(std::move(step));

        branch.results.push_back(std::move(*derived));
        return true;
    }

    GraphStore& store_;
    EngineConfig config_;

    std::atomic<uint64_t> forward_runs_{0};
    std::atomic<uint64_t> iterations_{0};
    std::atomic<uint64_t> rules_fired_{0};
    std::atomic<uint64_t> triples_derived_{0};
    mutable std::atomic<uint64_t> prove_calls_{0};
    mutable std::atomic<uint64_t> goals_expanded_{0};
};

} // namespace nyaya
