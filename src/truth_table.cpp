// ============================================================================
// truth_table.cpp — Truth-table enumeration and rendering
// ============================================================================

#include "pdm/truth_table.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace pdm {

// Rows are indexed by a 64-bit counter.
static constexpr std::size_t kMaxRepresentableAtoms = 62;

// ── working atom list ───────────────────────────────────────────────────────

static std::vector<std::string> working_atoms(const FormulaFactory& factory,
                                              const std::vector<NamedFormula>& formulas,
                                              const TruthTableOptions& options) {
    std::vector<std::string> out;
    if (options.atoms) {
        std::unordered_set<std::string> seen;
        for (const auto& a : *options.atoms) {
            if (seen.insert(a).second) out.push_back(a);
        }
        return out;
    }

    AtomSet all;
    for (const auto& f : formulas) {
        AtomSet s = factory.atoms(f.id);
        all.insert(s.begin(), s.end());
    }
    if (options.filter) {
        AtomSet s = factory.atoms(options.filter->id);
        all.insert(s.begin(), s.end());
    }
    out.assign(all.begin(), all.end());
    return out;
}

// ── generate_truth_table ────────────────────────────────────────────────────

TruthTable generate_truth_table(const FormulaFactory& factory,
                                const std::vector<NamedFormula>& formulas,
                                const TruthTableOptions& options) {
    TruthTable table;
    table.atoms = working_atoms(factory, formulas, options);
    for (const auto& f : formulas) {
        table.columns.push_back(f.name);
    }
    if (options.filter) {
        table.columns.push_back(options.filter->name);
    }

    const std::size_t n = table.atoms.size();
    if (n > kMaxRepresentableAtoms) {
        throw std::length_error("truth table over " + std::to_string(n) +
                                " atoms cannot be enumerated");
    }
    const std::uint64_t row_count = std::uint64_t{1} << n;

    Assignment assignment;
    for (std::uint64_t mask = 0; mask < row_count; ++mask) {
        TruthRow row;
        row.atom_values.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            bool v = ((mask >> (n - 1 - i)) & 1u) != 0;
            assignment[table.atoms[i]] = v;
            row.atom_values.push_back(v);
        }

        if (options.filter && !evaluate(factory, options.filter->id, assignment)) {
            continue;
        }

        row.formula_values.reserve(table.columns.size());
        for (const auto& f : formulas) {
            row.formula_values.push_back(evaluate(factory, f.id, assignment));
        }
        if (options.filter) {
            row.formula_values.push_back(true);
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

// ── TruthTable accessors ────────────────────────────────────────────────────

std::size_t TruthTable::column_index(const std::string& name) const {
    auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        throw std::out_of_range("truth table has no column '" + name + "'");
    }
    return static_cast<std::size_t>(it - columns.begin());
}

Assignment TruthTable::assignment(std::size_t row) const {
    Assignment a;
    const TruthRow& r = rows.at(row);
    for (std::size_t i = 0; i < atoms.size(); ++i) {
        a[atoms[i]] = r.atom_values[i];
    }
    return a;
}

TruthTable TruthTable::true_rows(const std::string& column) const {
    std::size_t col = column_index(column);
    TruthTable out;
    out.atoms = atoms;
    out.columns = columns;
    for (const auto& r : rows) {
        if (r.formula_values[col]) out.rows.push_back(r);
    }
    return out;
}

// ── Rendering ───────────────────────────────────────────────────────────────

std::string TruthTable::to_string() const {
    std::vector<std::string> headers = atoms;
    headers.insert(headers.end(), columns.begin(), columns.end());

    std::vector<std::size_t> widths;
    for (const auto& h : headers) {
        widths.push_back(std::max<std::size_t>(h.size(), 1));
    }

    std::ostringstream oss;
    auto cell = [&](std::size_t col, const std::string& text) {
        if (col > 0) oss << " | ";
        oss << text << std::string(widths[col] - text.size(), ' ');
    };

    for (std::size_t c = 0; c < headers.size(); ++c) cell(c, headers[c]);
    oss << "\n";
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) oss << "-+-";
        oss << std::string(widths[c], '-');
    }
    oss << "\n";

    for (const auto& r : rows) {
        std::size_t c = 0;
        for (bool v : r.atom_values)    cell(c++, v ? "T" : "F");
        for (bool v : r.formula_values) cell(c++, v ? "T" : "F");
        oss << "\n";
    }
    return oss.str();
}

// Wrap a string value for CSV: surround with double-quotes, escape inner ones.
static std::string csv_escape(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else          out += c;
    }
    out += '"';
    return out;
}

std::string TruthTable::to_csv() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& a : atoms) {
        if (!first) oss << ",";
        oss << csv_escape(a);
        first = false;
    }
    for (const auto& c : columns) {
        if (!first) oss << ",";
        oss << csv_escape(c);
        first = false;
    }
    oss << "\n";

    for (const auto& r : rows) {
        first = true;
        for (bool v : r.atom_values) {
            if (!first) oss << ",";
            oss << (v ? "true" : "false");
            first = false;
        }
        for (bool v : r.formula_values) {
            if (!first) oss << ",";
            oss << (v ? "true" : "false");
            first = false;
        }
        oss << "\n";
    }
    return oss.str();
}

}  // namespace pdm
