// ============================================================================
// backward.cpp — Backward-chaining prover and proof-tree rendering
// ============================================================================

#include "pdm/backward.hpp"

#include <algorithm>
#include <sstream>

namespace pdm {

const char* cycle_guard_name(CycleGuard g) noexcept {
    switch (g) {
        case CycleGuard::PerPath: return "path";
        case CycleGuard::Shared:  return "shared";
    }
    return "?";
}

// ── helpers ─────────────────────────────────────────────────────────────────

static ProofNode leaf(const std::string& goal, bool ok, std::string message) {
    ProofNode n;
    n.goal = goal;
    n.succeeded = ok;
    n.message = std::move(message);
    return n;
}

// ── BackwardStats ───────────────────────────────────────────────────────────

std::string BackwardStats::to_string() const {
    std::ostringstream oss;
    oss << "goals=" << goals_expanded
        << " rules_tried=" << rules_tried
        << " cycles=" << cycles_detected
        << " max_depth=" << max_depth;
    return oss.str();
}

// ── BackwardChainer ─────────────────────────────────────────────────────────

BackwardChainer::BackwardChainer(const FormulaFactory& factory)
    : factory_(factory) {}

ProofNode BackwardChainer::prove(const std::string& goal, const AtomSet& facts,
                                 const RuleList& rules) {
    stats_.reset();
    Search s{facts, rules, {}};
    return prove_goal(goal, s, 0);
}

ProofNode BackwardChainer::prove_goal(const std::string& goal, Search& s,
                                      std::uint32_t depth) {
    ++stats_.goals_expanded;
    stats_.max_depth = std::max(stats_.max_depth, depth);

    if (s.facts.count(goal) > 0) {
        return leaf(goal, true, "Given as a fact.");
    }
    if (s.guard.count(goal) > 0) {
        ++stats_.cycles_detected;
        return leaf(goal, false, "Cycle detected while proving this goal.");
    }

    s.guard.insert(goal);
    ProofNode result = expand(goal, s, depth);
    if (guard_ == CycleGuard::PerPath) {
        s.guard.erase(goal);
    }
    return result;
}

// Steps 3-5: try every rule that concludes the goal, first success wins.

ProofNode BackwardChainer::expand(const std::string& goal, Search& s,
                                  std::uint32_t depth) {
    bool any_applicable = false;

    for (const auto& rule : s.rules) {
        if (rule.conclusion_atoms(factory_).count(goal) == 0) {
            continue;
        }
        any_applicable = true;
        ++stats_.rules_tried;

        std::vector<ProofNode> children;
        bool all_ok = true;
        for (const auto& atom : rule.premise_atoms(factory_)) {
            children.push_back(prove_goal(atom, s, depth + 1));
            if (!children.back().succeeded) {
                all_ok = false;
            }
        }

        if (all_ok) {
            ProofNode n = leaf(goal, true, "Proved " + goal + " using rule " + rule.id + ".");
            n.rule_id = rule.id;
            n.premises = std::move(children);
            return n;
        }
    }

    if (!any_applicable) {
        return leaf(goal, false, "No rules conclude this goal.");
    }
    return leaf(goal, false, "All applicable rules failed to prove this goal.");
}

ProofNode backward_chain(const FormulaFactory& factory, const std::string& goal,
                         const AtomSet& facts, const RuleList& rules,
                         CycleGuard guard) {
    BackwardChainer chainer(factory);
    chainer.set_cycle_guard(guard);
    return chainer.prove(goal, facts, rules);
}

// ============================================================================
// ProofNode rendering
// ============================================================================

static void render_text(const ProofNode& n, int indent, std::ostringstream& oss) {
    oss << std::string(static_cast<std::size_t>(indent) * 2, ' ')
        << (n.succeeded ? "[+] " : "[-] ") << n.goal;
    if (n.rule_id) {
        oss << " (rule " << *n.rule_id << ")";
    }
    oss << ": " << n.message << "\n";
    for (const auto& child : n.premises) {
        render_text(child, indent + 1, oss);
    }
}

std::string ProofNode::to_string() const {
    std::ostringstream oss;
    render_text(*this, 0, oss);
    return oss.str();
}

static std::string dot_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

static int render_dot(const ProofNode& n, int& next_id, std::ostringstream& oss) {
    int id = next_id++;
    oss << "  n" << id << " [label=\"" << dot_escape(n.goal);
    if (n.rule_id) {
        oss << "\\n" << dot_escape(*n.rule_id);
    }
    oss << "\" color=" << (n.succeeded ? "darkgreen" : "red") << "];\n";
    for (const auto& child : n.premises) {
        int child_id = render_dot(child, next_id, oss);
        oss << "  n" << id << " -> n" << child_id << ";\n";
    }
    return id;
}

std::string ProofNode::to_dot() const {
    std::ostringstream oss;
    oss << "digraph ProofTree {\n";
    oss << "  rankdir=TB;\n";
    oss << "  node [shape=box fontname=\"Helvetica\"];\n";
    int next_id = 0;
    render_dot(*this, next_id, oss);
    oss << "}\n";
    return oss.str();
}

}  // namespace pdm
