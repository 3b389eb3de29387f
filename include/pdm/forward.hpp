// ============================================================================
// pdm/forward.hpp — Forward chaining and contradiction detection
// ============================================================================
//
// Algorithm (data-driven fixpoint):
//   1. Seed the working fact set with the initial facts.
//   2. Pass over the rules in order.  A rule fires when its premise holds
//      (premise atoms are true iff they are facts) and its conclusion makes
//      at least one new atom true.
//   3. Repeat passes until one fires nothing.
//   4. Scan the final facts for "X" / "NOT X" pairs.
//
// The fact set only grows and is bounded by the atoms of the rule set plus
// the initial facts, so the loop terminates.
//
// ============================================================================

#ifndef PDM_FORWARD_HPP
#define PDM_FORWARD_HPP

#include "pdm/ast.hpp"
#include "pdm/rules.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pdm {

/// Prefix that marks a fact as the negation of the atom that follows it.
inline constexpr const char* kNegationPrefix = "NOT ";

// ── ForwardStep ─────────────────────────────────────────────────────────────

struct ForwardStep {
    int         step = 0;       // 1-based
    std::string rule_id;
    AtomSet     inferred;
    std::string explanation;
};

/// (atom, message)
using Contradiction = std::pair<std::string, std::string>;

// ── ForwardResult ───────────────────────────────────────────────────────────

struct ForwardResult {
    AtomSet                    final_facts;
    std::vector<ForwardStep>   steps;
    std::vector<Contradiction> contradictions;
};

/// Atoms X such that both X and "NOT X" are facts, sorted by X.
std::vector<Contradiction> detect_contradictions(const AtomSet& facts);

// ── ForwardStats ────────────────────────────────────────────────────────────

struct ForwardStats {
    std::uint32_t passes = 0;
    std::uint32_t premise_evaluations = 0;
    std::uint32_t firings = 0;

    void reset() noexcept { *this = ForwardStats{}; }
    std::string to_string() const;
};

// ── ForwardChainer ──────────────────────────────────────────────────────────

class ForwardChainer {
public:
    explicit ForwardChainer(const FormulaFactory& factory);

    /// Run to fixpoint.  Each call is independent of the previous one.
    ForwardResult run(const AtomSet& initial_facts, const RuleList& rules);

    /// Statistics of the last run.
    const ForwardStats& stats() const noexcept { return stats_; }

private:
    // Conclusion atoms that become newly true given the current facts.
    AtomSet newly_satisfiable(FormulaId conclusion, const AtomSet& facts) const;

    const FormulaFactory& factory_;
    ForwardStats          stats_;
};

/// Convenience wrapper around ForwardChainer::run.
ForwardResult forward_chain(const FormulaFactory& factory,
                            const AtomSet& initial_facts, const RuleList& rules);

}  // namespace pdm

#endif  // PDM_FORWARD_HPP
