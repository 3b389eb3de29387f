// ============================================================================
// pdm/backward.hpp — Goal-directed backward chaining with proof trees
// ============================================================================
//
// Algorithm, per goal:
//   1. goal is a fact                    → success, "Given as a fact."
//   2. goal is in the cycle guard        → failure, cycle detected
//   3. no rule concludes goal            → failure
//   4. for each concluding rule in order, prove its premise atoms (sorted);
//      the first rule whose premises all succeed wins
//   5. otherwise                         → failure, all rules failed
//
// The result is always a complete ProofNode tree, so failed proofs can be
// rendered the same way as successful ones.  Partial attempts of rules that
// did not succeed are not kept.
//
// Cycle guard strategies:
//   PerPath  the guard holds the goals on the current recursion path only;
//            an atom may be proved again in an unrelated branch.
//   Shared   one visited set for the whole search, never cleared.  Once a
//            goal has been attempted anywhere it fails everywhere else.
//
// ============================================================================

#ifndef PDM_BACKWARD_HPP
#define PDM_BACKWARD_HPP

#include "pdm/ast.hpp"
#include "pdm/rules.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pdm {

// ── CycleGuard ──────────────────────────────────────────────────────────────

enum class CycleGuard : std::uint8_t {
    PerPath,
    Shared
};

const char* cycle_guard_name(CycleGuard g) noexcept;

// ── ProofNode ───────────────────────────────────────────────────────────────

struct ProofNode {
    std::string                goal;
    std::optional<std::string> rule_id;    // set iff proved via a rule
    std::vector<ProofNode>     premises;
    bool                       succeeded = false;
    std::string                message;

    /// Indented tree, one goal per line.
    std::string to_string() const;

    /// Graphviz rendering of the tree.
    std::string to_dot() const;
};

// ── BackwardStats ───────────────────────────────────────────────────────────

struct BackwardStats {
    std::uint32_t goals_expanded = 0;
    std::uint32_t rules_tried = 0;
    std::uint32_t cycles_detected = 0;
    std::uint32_t max_depth = 0;

    void reset() noexcept { *this = BackwardStats{}; }
    std::string to_string() const;
};

// ── BackwardChainer ─────────────────────────────────────────────────────────

class BackwardChainer {
public:
    explicit BackwardChainer(const FormulaFactory& factory);

    void set_cycle_guard(CycleGuard g) { guard_ = g; }
    CycleGuard cycle_guard() const noexcept { return guard_; }

    /// Try to prove `goal`.  A failed proof is a normal result.
    ProofNode prove(const std::string& goal, const AtomSet& facts,
                    const RuleList& rules);

    /// Statistics of the last prove() call.
    const BackwardStats& stats() const noexcept { return stats_; }

private:
    // Per-call search state.  Owned by prove(); never outlives it.
    struct Search {
        const AtomSet&        facts;
        const RuleList&       rules;
        std::set<std::string> guard;
    };

    ProofNode prove_goal(const std::string& goal, Search& s, std::uint32_t depth);
    ProofNode expand(const std::string& goal, Search& s, std::uint32_t depth);

    const FormulaFactory& factory_;
    CycleGuard            guard_ = CycleGuard::PerPath;
    BackwardStats         stats_;
};

/// Convenience wrapper around BackwardChainer::prove.
ProofNode backward_chain(const FormulaFactory& factory, const std::string& goal,
                         const AtomSet& facts, const RuleList& rules,
                         CycleGuard guard = CycleGuard::PerPath);

}  // namespace pdm

#endif  // PDM_BACKWARD_HPP
