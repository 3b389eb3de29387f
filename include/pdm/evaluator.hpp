// ============================================================================
// pdm/evaluator.hpp — Truth value of a formula under an assignment
// ============================================================================

#ifndef PDM_EVALUATOR_HPP
#define PDM_EVALUATOR_HPP

#include "pdm/ast.hpp"

#include <string>
#include <unordered_map>

namespace pdm {

/// Atom name → truth value.  Atoms absent from the map are false.
using Assignment = std::unordered_map<std::string, bool>;

/// Evaluate `id` under `assignment`.  Pure; throws InternalError only if the
/// factory holds a node outside the closed kind set.
bool evaluate(const FormulaFactory& factory, FormulaId id,
              const Assignment& assignment);

/// Assignment over `atoms` where an atom is true iff it is in `facts`.
Assignment assignment_from_facts(const AtomSet& atoms, const AtomSet& facts);

}  // namespace pdm

#endif  // PDM_EVALUATOR_HPP
