// ============================================================================
// pdm/z3_solver.hpp — Z3 wrapper for propositional satisfiability queries
// ============================================================================
//
// This module encodes formulas as Z3 boolean terms and answers
// satisfiability, validity and equivalence questions about them.  It is an
// independent cross-check on the enumeration-based truth tables and a quick
// way to ask whether a rule set is consistent with a set of facts.
//
// Usage:
//   SatChecker checker(factory);
//   checker.add_formula(id);
//   checker.add_fact("Fever");
//   if (checker.check() == SatResult::Sat) {
//       Assignment m = checker.model();
//   }
//
// Z3 is NOT used by the inference engines: forward and backward chaining
// are rule-based and never consult the solver.
//
// ============================================================================

#ifndef PDM_Z3_SOLVER_HPP
#define PDM_Z3_SOLVER_HPP

#include "pdm/ast.hpp"
#include "pdm/evaluator.hpp"
#include "pdm/rules.hpp"

#include <z3++.h>

#include <memory>
#include <string>
#include <unordered_map>

namespace pdm {

// ── SatResult ───────────────────────────────────────────────────────────────

enum class SatResult {
    Sat,
    Unsat,
    Unknown
};

const char* sat_result_name(SatResult r) noexcept;

// ── SatChecker ──────────────────────────────────────────────────────────────
// Maintains a Z3 context and solver.  Assertions are added incrementally and
// check() determines satisfiability of their conjunction.

class SatChecker {
public:
    explicit SatChecker(const FormulaFactory& factory);

    /// Assert a formula.
    void add_formula(FormulaId formula_id);

    /// Assert a fact.  A fact spelled "NOT X" asserts the negation of X.
    void add_fact(const std::string& fact);

    /// Assert every rule as the implication premise -> conclusion.
    void add_rules(const RuleList& rules);

    /// Check satisfiability of all assertions.
    SatResult check();

    /// Reset the solver to an empty state.
    void reset();

    /// Values of every atom seen so far in a satisfying assignment.
    /// Throws std::runtime_error if the assertions are not satisfiable.
    Assignment model();

    // ── One-shot queries (do not disturb the current assertions) ────────
    bool is_satisfiable(FormulaId formula_id);
    bool is_valid(FormulaId formula_id);
    bool equivalent(FormulaId lhs, FormulaId rhs);

private:
    // Convert a formula to a Z3 boolean term.
    z3::expr to_z3(FormulaId id);

    // Get or create a Z3 boolean variable for the given atom name.
    z3::expr get_bool_var(const std::string& name);

    // Satisfiability of `e` together with the current assertions.
    bool satisfiable_with(const z3::expr& e);

    const FormulaFactory& factory_;
    z3::context           ctx_;
    z3::solver            solver_;

    // Map from atom names to Z3 boolean constants.
    std::unordered_map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
};

/// True iff the rules, read as implications, and the facts have a model.
bool rules_consistent(const FormulaFactory& factory, const RuleList& rules,
                      const AtomSet& facts);

}  // namespace pdm

#endif  // PDM_Z3_SOLVER_HPP
