// ============================================================================
// ast.cpp — Implementation of the formula AST, interning, and pretty-printing
// ============================================================================

#include "pdm/ast.hpp"
#include "pdm/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace pdm {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Atom:    return "Atom";
        case NodeKind::Not:     return "NOT";
        case NodeKind::And:     return "AND";
        case NodeKind::Or:      return "OR";
        case NodeKind::Xor:     return "XOR";
        case NodeKind::Implies: return "->";
        case NodeKind::Iff:     return "<->";
    }
    return "?";
}

// ── precedence ──────────────────────────────────────────────────────────────

int precedence(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Iff:     return 1;
        case NodeKind::Implies: return 2;
        case NodeKind::Or:      return 3;
        case NodeKind::Xor:     return 4;
        case NodeKind::And:     return 5;
        case NodeKind::Not:     return 6;
        case NodeKind::Atom:    return 7;
    }
    return 0;
}

bool is_binary(NodeKind k) noexcept {
    return k == NodeKind::And || k == NodeKind::Or || k == NodeKind::Xor ||
           k == NodeKind::Implies || k == NodeKind::Iff;
}

// ── FormulaNode ─────────────────────────────────────────────────────────────

bool FormulaNode::operator==(const FormulaNode& o) const noexcept {
    return kind == o.kind && children[0] == o.children[0] &&
           children[1] == o.children[1] && atom_name == o.atom_name;
}

static void mix(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

std::size_t FormulaNodeHash::operator()(const FormulaNode& n) const noexcept {
    std::size_t seed = static_cast<std::size_t>(n.kind);
    mix(seed, std::hash<std::string>{}(n.atom_name));
    mix(seed, n.children[0]);
    mix(seed, n.children[1]);
    return seed;
}

// ── Interning ───────────────────────────────────────────────────────────────

FormulaId FormulaFactory::intern(FormulaNode n) {
    if (auto hit = intern_.find(n); hit != intern_.end()) {
        return hit->second;
    }
    const auto fresh = static_cast<FormulaId>(nodes_.size());
    nodes_.push_back(n);
    intern_.emplace(std::move(n), fresh);
    return fresh;
}

FormulaId FormulaFactory::make_atom(const std::string& name) {
    FormulaNode leaf;
    leaf.kind = NodeKind::Atom;
    leaf.atom_name = name;
    return intern(std::move(leaf));
}

FormulaId FormulaFactory::make_not(FormulaId child) {
    FormulaNode neg;
    neg.kind = NodeKind::Not;
    neg.children[0] = child;
    neg.depth = node(child).depth + 1;
    return intern(std::move(neg));
}

FormulaId FormulaFactory::make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs) {
    if (!is_binary(kind)) {
        throw InternalError(std::string("make_binary: not a binary connective: ") +
                            node_kind_name(kind));
    }
    FormulaNode bin;
    bin.kind = kind;
    bin.children[0] = lhs;
    bin.children[1] = rhs;
    bin.depth = std::max(node(lhs).depth, node(rhs).depth) + 1;
    return intern(std::move(bin));
}

FormulaId FormulaFactory::make_and(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::And, lhs, rhs);
}

FormulaId FormulaFactory::make_or(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Or, lhs, rhs);
}

FormulaId FormulaFactory::make_xor(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Xor, lhs, rhs);
}

FormulaId FormulaFactory::make_implies(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Implies, lhs, rhs);
}

FormulaId FormulaFactory::make_iff(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Iff, lhs, rhs);
}

// ── Lookup ──────────────────────────────────────────────────────────────────

const FormulaNode& FormulaFactory::node(FormulaId id) const {
    if (id >= nodes_.size()) {
        throw InternalError("FormulaFactory::node: unknown FormulaId " +
                            std::to_string(id));
    }
    return nodes_[id];
}

// ── atoms ───────────────────────────────────────────────────────────────────

void FormulaFactory::collect_atoms(FormulaId id, AtomSet& out) const {
    const FormulaNode& n = node(id);
    if (n.kind == NodeKind::Atom) {
        out.insert(n.atom_name);
        return;
    }
    collect_atoms(n.children[0], out);
    if (is_binary(n.kind)) {
        collect_atoms(n.children[1], out);
    }
}

AtomSet FormulaFactory::atoms(FormulaId id) const {
    AtomSet out;
    collect_atoms(id, out);
    return out;
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// A child is wrapped when it binds more loosely than its parent.  The right
// operand of a binary node is also wrapped at equal precedence: the parser
// folds to the left, so "a -> (b -> c)" must keep its parentheses.

std::string FormulaFactory::to_string(FormulaId id) const {
    const FormulaNode& n = node(id);

    auto operand = [this](FormulaId child, int parent_prec, bool right) {
        int p = precedence(node(child).kind);
        std::string s = to_string(child);
        if (p < parent_prec || (right && p == parent_prec)) {
            return "(" + s + ")";
        }
        return s;
    };

    switch (n.kind) {
        case NodeKind::Atom:
            return n.atom_name;
        case NodeKind::Not:
            return "NOT " + operand(n.children[0], precedence(n.kind), false);
        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Xor:
        case NodeKind::Implies:
        case NodeKind::Iff: {
            int p = precedence(n.kind);
            return operand(n.children[0], p, false) + " " + node_kind_name(n.kind) +
                   " " + operand(n.children[1], p, true);
        }
    }
    throw InternalError("FormulaFactory::to_string: unknown node kind");
}

}  // namespace pdm
