// ============================================================================
// pdm/ast.hpp — Abstract Syntax Tree for propositional formulas
// ============================================================================
//
// Formulas live in a hash-consed DAG: building the same structure twice
// yields the same FormulaId, so equality is an integer compare and a
// FormulaId is a plain value that can be copied anywhere.
//
//   Node kinds (closed set):
//     - Atom    : propositional variable (string label)
//     - Not     : negation, child[0]
//     - And     : conjunction, child[0] AND child[1]
//     - Or      : disjunction, child[0] OR child[1]
//     - Xor     : exclusive or, child[0] XOR child[1]
//     - Implies : material implication child[0] -> child[1]
//     - Iff     : biconditional child[0] <-> child[1]
//
//   Rules, truth tables and engines hold FormulaIds; the FormulaFactory
//   that produced them must outlive them.
//
// ============================================================================

#ifndef PDM_AST_HPP
#define PDM_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace pdm {

// ── FormulaId ───────────────────────────────────────────────────────────────
// Index into FormulaFactory's node table; kInvalidId means "unset".

using FormulaId = std::uint32_t;
inline constexpr FormulaId kInvalidId = static_cast<FormulaId>(-1);

/// Set of atom names.  Ordered so that iteration is deterministic.
using AtomSet = std::set<std::string>;

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    Atom,
    Not,
    And,
    Or,
    Xor,
    Implies,
    Iff
};

/// Operator spelling used by the printer ("AND", "->", ...).
const char* node_kind_name(NodeKind k) noexcept;

/// Binding strength of a node kind, loosest (Iff = 1) to tightest (Atom = 7).
/// The parser and the printer share this table.
int precedence(NodeKind k) noexcept;

/// True for the five binary connectives.
bool is_binary(NodeKind k) noexcept;

// ── FormulaNode ─────────────────────────────────────────────────────────────
// Never modified once interned.  Unused child slots hold kInvalidId.

struct FormulaNode {
    NodeKind    kind{};
    std::string atom_name;       // non-empty for Atom nodes
    FormulaId   children[2]{kInvalidId, kInvalidId};
    std::uint32_t depth = 1;     // nodes on the longest path to an atom


    bool operator==(const FormulaNode& o) const noexcept;
};

// ── FormulaNodeHash ─────────────────────────────────────────────────────────

struct FormulaNodeHash {
    std::size_t operator()(const FormulaNode& n) const noexcept;
};

// ── FormulaFactory ──────────────────────────────────────────────────────────
// Not thread-safe.  make_*() validates child handles and returns the unique
// id of the requested structure.

class FormulaFactory {
public:
    FormulaFactory() = default;

    // ── Builders ────────────────────────────────────────────────────────
    FormulaId make_atom(const std::string& name);
    FormulaId make_not(FormulaId child);
    FormulaId make_and(FormulaId lhs, FormulaId rhs);
    FormulaId make_or(FormulaId lhs, FormulaId rhs);
    FormulaId make_xor(FormulaId lhs, FormulaId rhs);
    FormulaId make_implies(FormulaId lhs, FormulaId rhs);
    FormulaId make_iff(FormulaId lhs, FormulaId rhs);

    /// Build a binary node of the given kind.  Throws InternalError when
    /// `kind` is not one of the binary connectives.
    FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs);

    // ── Lookup ──────────────────────────────────────────────────────────
    /// Throws InternalError for an id this factory never issued.
    const FormulaNode& node(FormulaId id) const;

    /// Number of distinct nodes interned so far.
    std::size_t node_count() const noexcept { return nodes_.size(); }

    /// Union of the atom names reachable from `id`.
    AtomSet atoms(FormulaId id) const;

    // ── Printing ────────────────────────────────────────────────────────
    // Canonical text using the grammar's keywords and the minimum number of
    // parentheses that still parses back to the same FormulaId.
    std::string to_string(FormulaId id) const;

private:
    FormulaId intern(FormulaNode node);

    void collect_atoms(FormulaId id, AtomSet& out) const;

    std::vector<FormulaNode>                                    nodes_;
    std::unordered_map<FormulaNode, FormulaId, FormulaNodeHash> intern_;
};

}  // namespace pdm

#endif  // PDM_AST_HPP
