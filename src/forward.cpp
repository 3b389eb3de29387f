// ============================================================================
// forward.cpp — Forward-chaining fixpoint
// ============================================================================

#include "pdm/forward.hpp"
#include "pdm/evaluator.hpp"
#include "pdm/utils.hpp"

#include <sstream>
#include <string_view>

namespace pdm {

// ── detect_contradictions ───────────────────────────────────────────────────

std::vector<Contradiction> detect_contradictions(const AtomSet& facts) {
    const std::string_view prefix(kNegationPrefix);

    AtomSet positives;
    AtomSet negatives;
    for (const auto& f : facts) {
        if (f.starts_with(prefix)) {
            negatives.insert(f.substr(prefix.size()));
        } else {
            positives.insert(f);
        }
    }

    // Both sets are ordered, so the result is sorted by atom name.
    std::vector<Contradiction> out;
    for (const auto& atom : negatives) {
        if (positives.count(atom) > 0) {
            out.emplace_back(atom, "Contradiction between " + atom + " and " +
                                       std::string(prefix) + atom);
        }
    }
    return out;
}

// ── ForwardStats ────────────────────────────────────────────────────────────

std::string ForwardStats::to_string() const {
    std::ostringstream oss;
    oss << "passes=" << passes
        << " premise_evaluations=" << premise_evaluations
        << " firings=" << firings;
    return oss.str();
}

// ── ForwardChainer ──────────────────────────────────────────────────────────

ForwardChainer::ForwardChainer(const FormulaFactory& factory)
    : factory_(factory) {}

// An atom is newly satisfiable when forcing it to true, with every other
// conclusion atom at its current fact value, makes the conclusion true.

AtomSet ForwardChainer::newly_satisfiable(FormulaId conclusion,
                                          const AtomSet& facts) const {
    AtomSet atoms = factory_.atoms(conclusion);
    Assignment base = assignment_from_facts(atoms, facts);

    AtomSet out;
    for (const auto& a : atoms) {
        if (facts.count(a) > 0) continue;
        Assignment forced = base;
        forced[a] = true;
        if (evaluate(factory_, conclusion, forced)) {
            out.insert(a);
        }
    }
    return out;
}

ForwardResult ForwardChainer::run(const AtomSet& initial_facts, const RuleList& rules) {
    stats_.reset();

    ForwardResult result;
    AtomSet& facts = result.final_facts;
    facts = initial_facts;
    int step_counter = 1;

    bool fired_any = true;
    while (fired_any) {
        fired_any = false;
        ++stats_.passes;

        for (const auto& rule : rules) {
            AtomSet premise_atoms = rule.premise_atoms(factory_);
            ++stats_.premise_evaluations;
            if (!evaluate(factory_, rule.premise, assignment_from_facts(premise_atoms, facts))) {
                continue;
            }

            AtomSet new_atoms = newly_satisfiable(rule.conclusion, facts);
            if (new_atoms.empty()) {
                continue;
            }

            fired_any = true;
            ++stats_.firings;
            facts.insert(new_atoms.begin(), new_atoms.end());

            ForwardStep step;
            step.step = step_counter++;
            step.rule_id = rule.id;
            step.explanation = "Step " + std::to_string(step.step) + ": " + rule.id +
                               " fired because " + join(premise_atoms, " and ") +
                               " are True -> inferred " + join(new_atoms, ", ") + ".";
            step.inferred = std::move(new_atoms);
            result.steps.push_back(std::move(step));
        }
    }

    result.contradictions = detect_contradictions(facts);
    return result;
}

ForwardResult forward_chain(const FormulaFactory& factory,
                            const AtomSet& initial_facts, const RuleList& rules) {
    ForwardChainer chainer(factory);
    return chainer.run(initial_facts, rules);
}

}  // namespace pdm
