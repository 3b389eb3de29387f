// ============================================================================
// evaluator.cpp — Formula evaluation
// ============================================================================

#include "pdm/evaluator.hpp"
#include "pdm/errors.hpp"

namespace pdm {

bool evaluate(const FormulaFactory& factory, FormulaId id,
              const Assignment& assignment) {
    const FormulaNode& n = factory.node(id);

    switch (n.kind) {
        case NodeKind::Atom: {
            auto it = assignment.find(n.atom_name);
            return it != assignment.end() && it->second;
        }
        case NodeKind::Not:
            return !evaluate(factory, n.children[0], assignment);
        case NodeKind::And:
            return evaluate(factory, n.children[0], assignment) &&
                   evaluate(factory, n.children[1], assignment);
        case NodeKind::Or:
            return evaluate(factory, n.children[0], assignment) ||
                   evaluate(factory, n.children[1], assignment);
        case NodeKind::Xor:
            return evaluate(factory, n.children[0], assignment) !=
                   evaluate(factory, n.children[1], assignment);
        case NodeKind::Implies:
            return !evaluate(factory, n.children[0], assignment) ||
                   evaluate(factory, n.children[1], assignment);
        case NodeKind::Iff:
            return evaluate(factory, n.children[0], assignment) ==
                   evaluate(factory, n.children[1], assignment);
    }
    throw InternalError("evaluate: unknown node kind");
}

Assignment assignment_from_facts(const AtomSet& atoms, const AtomSet& facts) {
    Assignment a;
    for (const auto& atom : atoms) {
        a[atom] = facts.count(atom) > 0;
    }
    return a;
}

}  // namespace pdm
