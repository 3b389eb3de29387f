// ============================================================================
// z3_solver.cpp — Implementation of the Z3 satisfiability checker
// ============================================================================

#include "pdm/z3_solver.hpp"
#include "pdm/errors.hpp"
#include "pdm/forward.hpp"

#include <stdexcept>
#include <string_view>

namespace pdm {

const char* sat_result_name(SatResult r) noexcept {
    switch (r) {
        case SatResult::Sat:     return "SATISFIABLE";
        case SatResult::Unsat:   return "UNSATISFIABLE";
        case SatResult::Unknown: return "UNKNOWN";
    }
    return "?";
}

// ── SatChecker ──────────────────────────────────────────────────────────────

SatChecker::SatChecker(const FormulaFactory& factory)
    : factory_(factory), ctx_(), solver_(ctx_) {}

void SatChecker::reset() {
    solver_.reset();
    bool_vars_.clear();
}

z3::expr SatChecker::get_bool_var(const std::string& name) {
    auto it = bool_vars_.find(name);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    bool_vars_[name] = std::move(var);
    return result;
}

z3::expr SatChecker::to_z3(FormulaId id) {
    const FormulaNode& n = factory_.node(id);

    switch (n.kind) {
        case NodeKind::Atom:
            return get_bool_var(n.atom_name);
        case NodeKind::Not:
            return !to_z3(n.children[0]);
        case NodeKind::And:
            return to_z3(n.children[0]) && to_z3(n.children[1]);
        case NodeKind::Or:
            return to_z3(n.children[0]) || to_z3(n.children[1]);
        case NodeKind::Xor:
            return to_z3(n.children[0]) ^ to_z3(n.children[1]);
        case NodeKind::Implies:
            return z3::implies(to_z3(n.children[0]), to_z3(n.children[1]));
        case NodeKind::Iff:
            return to_z3(n.children[0]) == to_z3(n.children[1]);
    }
    throw InternalError("SatChecker::to_z3: unknown node kind");
}

void SatChecker::add_formula(FormulaId formula_id) {
    solver_.add(to_z3(formula_id));
}

void SatChecker::add_fact(const std::string& fact) {
    const std::string_view prefix(kNegationPrefix);
    if (fact.starts_with(prefix)) {
        solver_.add(!get_bool_var(fact.substr(prefix.size())));
    } else {
        solver_.add(get_bool_var(fact));
    }
}

void SatChecker::add_rules(const RuleList& rules) {
    for (const auto& r : rules) {
        solver_.add(z3::implies(to_z3(r.premise), to_z3(r.conclusion)));
    }
}

SatResult SatChecker::check() {
    switch (solver_.check()) {
        case z3::sat:     return SatResult::Sat;
        case z3::unsat:   return SatResult::Unsat;
        case z3::unknown: return SatResult::Unknown;
    }
    return SatResult::Unknown;
}

Assignment SatChecker::model() {
    if (solver_.check() != z3::sat) {
        throw std::runtime_error("SatChecker::model: assertions are not satisfiable");
    }
    z3::model m = solver_.get_model();
    Assignment out;
    for (const auto& entry : bool_vars_) {
        out[entry.first] = m.eval(*entry.second, true).is_true();
    }
    return out;
}

// ── One-shot queries ────────────────────────────────────────────────────────

bool SatChecker::satisfiable_with(const z3::expr& e) {
    solver_.push();
    solver_.add(e);
    z3::check_result r = solver_.check();
    solver_.pop();
    if (r == z3::unknown) {
        throw std::runtime_error("z3 returned unknown: " + solver_.reason_unknown());
    }
    return r == z3::sat;
}

bool SatChecker::is_satisfiable(FormulaId formula_id) {
    return satisfiable_with(to_z3(formula_id));
}

bool SatChecker::is_valid(FormulaId formula_id) {
    return !satisfiable_with(!to_z3(formula_id));
}

bool SatChecker::equivalent(FormulaId lhs, FormulaId rhs) {
    return !satisfiable_with(to_z3(lhs) != to_z3(rhs));
}

bool rules_consistent(const FormulaFactory& factory, const RuleList& rules,
                      const AtomSet& facts) {
    SatChecker checker(factory);
    checker.add_rules(rules);
    for (const auto& f : facts) {
        checker.add_fact(f);
    }
    SatResult r = checker.check();
    if (r == SatResult::Unknown) {
        throw std::runtime_error("z3 returned unknown while checking rule consistency");
    }
    return r == SatResult::Sat;
}

}  // namespace pdm
