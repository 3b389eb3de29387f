// ============================================================================
// pdm/rules.hpp — Rules, rule records, and rule files
// ============================================================================
//
// A Rule pairs a premise formula with a conclusion formula.  Rules are
// loaded from RuleRecords: flat key/value maps with the keys
//
//     id  premise  conclusion  text
//
// A RuleBook groups records by domain (e.g. "medical", "loan").  Rule books
// are read from and written to a line-oriented text format:
//
//     # comment
//     [medical]
//     id         = R1
//     premise    = Fever AND (Cough OR SoreThroat)
//     conclusion = Flu
//     text       = Influenza is likely
//
// An `id` line starts a new record.  Records that appear before the first
// [domain] header belong to the domain "default".
//
// ============================================================================

#ifndef PDM_RULES_HPP
#define PDM_RULES_HPP

#include "pdm/ast.hpp"

#include <map>
#include <string>
#include <vector>

namespace pdm {

// ── Rule ────────────────────────────────────────────────────────────────────
// Formulas live in the FormulaFactory the rule was loaded into.

struct Rule {
    std::string id;
    FormulaId   premise    = kInvalidId;
    FormulaId   conclusion = kInvalidId;
    std::string description;

    AtomSet premise_atoms(const FormulaFactory& f) const { return f.atoms(premise); }
    AtomSet conclusion_atoms(const FormulaFactory& f) const { return f.atoms(conclusion); }
};

using RuleList = std::vector<Rule>;

/// Parse both formula texts and build a rule.  Throws SyntaxError.
Rule make_rule(const std::string& id, const std::string& premise,
               const std::string& conclusion, const std::string& description,
               FormulaFactory& factory);

// ── RuleRecord / RuleBook ───────────────────────────────────────────────────

using RuleRecord = std::map<std::string, std::string>;

struct RuleBook {
    std::vector<std::string>                              domains;  // file order
    std::map<std::string, std::vector<RuleRecord>>        records;

    bool has_domain(const std::string& d) const { return records.count(d) > 0; }
    void add(const std::string& domain, RuleRecord record);
};

/// Load records in order.  Throws RuleLoadError when a record misses a key
/// or one of its formulas does not parse.
RuleList load_rules(const std::vector<RuleRecord>& records, FormulaFactory& factory);

/// Load one domain of a rule book.  An absent domain yields an empty list.
RuleList load_rule_set(const RuleBook& book, const std::string& domain,
                       FormulaFactory& factory);

/// Inverse of load: formulas rendered with the canonical printer.
RuleRecord to_record(const Rule& rule, const FormulaFactory& factory);

/// Every atom mentioned by any premise or conclusion.
AtomSet rule_atoms(const RuleList& rules, const FormulaFactory& factory);

// ── Rule files ──────────────────────────────────────────────────────────────

/// Parse rule-file lines.  Throws RuleLoadError with the 1-based line number.
RuleBook parse_rule_book(const std::vector<std::string>& lines);

/// Read and parse a rule file.  Throws std::runtime_error if unreadable.
RuleBook read_rule_file(const std::string& path);

/// Render a rule book in the rule-file format.
std::string format_rule_book(const RuleBook& book);

}  // namespace pdm

#endif  // PDM_RULES_HPP
