#pragma once
// Proofs: checkable justifications for derived triples
//
// A LogicProof lists rule applications bottom-up. Each step names a rule,
// the TripleIds it consumed (stored facts or outputs of earlier steps) and
// the triple it produced. The last step produces the conclusion; a proof
// with no steps claims the conclusion is itself a stored fact.
//
// ProofVerifier replays the steps against a snapshot without searching:
// one unification per step.

#include "unify.hpp"
#include <sstream>

namespace nyaya {

struct ProofStep {
    std::string rule_name;
    std::vector<TripleId> premises;
    Triple derived;
};

struct LogicProof {
    Triple conclusion;
    std::vector<ProofStep> steps;

    bool is_fact() const { return steps.empty(); }

    // SHA-256 over the conclusion and every step, in order
    TripleId digest() const {
        std::vector<uint8_t> buf = encode(conclusion);
        ByteWriter w(buf);
        w.u32(static_cast<uint32_t>(steps.size()));
        for (const auto& step : steps) {
            w.str(step.rule_name);
            w.u32(static_cast<uint32_t>(step.premises.size()));
            for (const auto& id : step.premises) {
                buf.insert(buf.end(), id.bytes.begin(), id.bytes.end());
            }
            auto derived = encode(step.derived);
            w.u32(static_cast<uint32_t>(derived.size()));
            buf.insert(buf.end(), derived.begin(), derived.end());
        }
        return sha256(buf.data(), buf.size());
    }

    // Longest chain of rule applications feeding the conclusion
    size_t depth() const {
        std::unordered_map<TripleId, size_t, TripleIdHash> level;
        size_t deepest = 0;
        for (const auto& step : steps) {
            size_t d = 1;
            for (const auto& id : step.premises) {
                auto it = level.find(id);
                if (it != level.end()) d = std::max(d, it->second + 1);
            }
            level[triple_id(step.derived)] = d;
            deepest = std::max(deepest, d);
        }
        return deepest;
    }

    std::string to_string() const {
        std::ostringstream out;
        out << "proof of " << conclusion.to_string();
        if (steps.empty()) {
            out << ": stored fact\n";
            return out.str();
        }
        out << " (" << steps.size() << " steps)\n";
        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& s = steps[i];
            out << "  " << (i + 1) << ". [" << s.rule_name << "] ";
            for (size_t j = 0; j < s.premises.size(); ++j) {
                out << (j ? ", " : "") << s.premises[j].short_hex();
            }
            out << " => " << s.derived.to_string() << "\n";
        }
        return out.str();
    }
};

class ProofVerifier {
public:
    explicit ProofVerifier(RuleSet rules) : rules_(std::move(rules)) {}

    // Throws InvalidProof naming the first step that does not check out
    void verify(const LogicProof& proof, const FactSource& snapshot) const {
        if (proof.steps.empty()) {
            if (!snapshot.contains(proof.conclusion)) {
                fail("conclusion " + proof.conclusion.to_string() + " is not a stored fact");
            }
            return;
        }

        std::unordered_map<TripleId, Triple, TripleIdHash> derived;
        for (size_t i = 0; i < proof.steps.size(); ++i) {
            const auto& step = proof.steps[i];
            std::string at = "step " + std::to_string(i + 1) + " [" + step.rule_name + "]: ";

            const Rule* rule = rules_.find(step.rule_name);
            if (!rule) fail(at + "unknown rule");
            if (!rule->enabled) fail(at + "rule is disabled");
            if (!rule->has_assert()) fail(at + "rule derives nothing");
            if (step.premises.size() != rule->conditions.size()) {
                fail(at + std::to_string(step.premises.size()) + " premises for " +
                     std::to_string(rule->conditions.size()) + " conditions");
            }

            std::vector<Triple> premises;
            premises.reserve(step.premises.size());
            for (const auto& id : step.premises) {
                auto it = derived.find(id);
                if (it != derived.end()) {
                    premises.push_back(it->second);
                    continue;
                }
                auto fact = snapshot.get(id);
                if (!fact) {
                    fail(at + "premise " + id.short_hex() +
                         " is neither a stored fact nor derived by an earlier step");
                }
                premises.push_back(std::move(*fact));
            }

            auto bindings = unify_premises(rule->conditions, premises);
            if (!bindings) fail(at + "premises do not satisfy the rule's conditions");

            bool produced = false;
            for (const auto& action : rule->actions) {
                if (action.kind != Action::Kind::Assert) continue;
                auto t = try_instantiate(action.pattern, *bindings);
                if (t && *t == step.derived) {
                    produced = true;
                    break;
                }
            }
            if (!produced) fail(at + step.derived.to_string() + " does not follow from the premises");

            derived.emplace(triple_id(step.derived), step.derived);
        }

        if (proof.steps.back().derived != proof.conclusion) {
            fail("last step derives " + proof.steps.back().derived.to_string() +
                 ", not the conclusion " + proof.conclusion.to_string());
        }
    }

    bool check(const LogicProof& proof, const FactSource& snapshot, std::string* why = nullptr) const {
        try {
            verify(proof, snapshot);
            return true;
        } catch (const LogicError& e) {
            if (e.kind() != LogicErrorKind::InvalidProof) throw;
            if (why) *why = e.message();
            return false;
        }
    }

    const RuleSet& rules() const { return rules_; }

private:
    [[noreturn]] static void fail(const std::string& why) {
        throw LogicError(LogicErrorKind::InvalidProof, why);
    }

    RuleSet rules_;
};

} // namespace nyaya
