// ============================================================================
// pdm/truth_table.hpp — Truth-table enumeration
// ============================================================================
//
// Rows are enumerated as a binary counter over the ordered atom list with
// the LAST atom as the least-significant bit, starting from all-false:
//
//   atoms [A, B]  →  rows  FF, FT, TF, TT
//
// The generator does not limit the number of atoms; callers decide how
// many rows they are prepared to materialise.
//
// ============================================================================

#ifndef PDM_TRUTH_TABLE_HPP
#define PDM_TRUTH_TABLE_HPP

#include "pdm/ast.hpp"
#include "pdm/evaluator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pdm {

// ── NamedFormula ────────────────────────────────────────────────────────────

struct NamedFormula {
    std::string name;
    FormulaId   id = kInvalidId;
};

// ── TruthRow ────────────────────────────────────────────────────────────────

struct TruthRow {
    std::vector<bool> atom_values;      // parallel to TruthTable::atoms
    std::vector<bool> formula_values;   // parallel to TruthTable::columns
};

// ── TruthTable ──────────────────────────────────────────────────────────────

struct TruthTable {
    std::vector<std::string> atoms;
    std::vector<std::string> columns;
    std::vector<TruthRow>    rows;

    /// Index of a formula column.  Throws std::out_of_range if unknown.
    std::size_t column_index(const std::string& name) const;

    /// The assignment a row represents.
    Assignment assignment(std::size_t row) const;

    /// Rows where the named formula column is true.
    TruthTable true_rows(const std::string& column) const;

    /// Aligned text, one line per row, T/F cells.
    std::string to_string() const;

    /// RFC 4180 CSV with a header line.
    std::string to_csv() const;
};

// ── TruthTableOptions ───────────────────────────────────────────────────────

struct TruthTableOptions {
    /// Explicit atom order.  Duplicates are dropped (first occurrence wins).
    /// When absent, the sorted union of the formulas' atoms is used.
    std::optional<std::vector<std::string>> atoms;

    /// Rows where this formula is false are dropped; its column is appended.
    std::optional<NamedFormula> filter;
};

/// Enumerate all assignments over the working atom set and evaluate every
/// formula per row.  Zero atoms yield exactly one row.
TruthTable generate_truth_table(const FormulaFactory& factory,
                                const std::vector<NamedFormula>& formulas,
                                const TruthTableOptions& options = {});

}  // namespace pdm

#endif  // PDM_TRUTH_TABLE_HPP
