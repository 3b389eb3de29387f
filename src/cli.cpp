// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "pdm/cli.hpp"
#include "pdm/ast.hpp"
#include "pdm/evaluator.hpp"
#include "pdm/forward.hpp"
#include "pdm/parser.hpp"
#include "pdm/rules.hpp"
#include "pdm/test.hpp"
#include "pdm/truth_table.hpp"
#include "pdm/utils.hpp"
#include "pdm/z3_solver.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace pdm {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--rules") {
            opts.rules_path = value_of(i, arg);
        } else if (arg == "--domain") {
            opts.domain = value_of(i, arg);
        } else if (arg == "--facts") {
            for (auto& f : split_list(value_of(i, arg))) {
                opts.facts.push_back(std::move(f));
            }
        } else if (arg == "--forward") {
            opts.forward = true;
        } else if (arg == "--prove") {
            opts.goal = value_of(i, arg);
        } else if (arg == "--cycle-guard") {
            std::string g = value_of(i, arg);
            if (g == "path") {
                opts.cycle_guard = CycleGuard::PerPath;
            } else if (g == "shared") {
                opts.cycle_guard = CycleGuard::Shared;
            } else {
                throw std::runtime_error("--cycle-guard must be 'path' or 'shared'");
            }
        } else if (arg == "--eval") {
            opts.eval = true;
        } else if (arg == "--all") {
            opts.all = true;
        } else if (arg == "--true-rows") {
            opts.true_rows = true;
        } else if (arg == "--csv") {
            opts.csv = true;
        } else if (arg == "--check") {
            opts.check = true;
        } else if (arg == "--list") {
            opts.list = true;
        } else if (arg == "--dot") {
            opts.dot = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple formula inputs not supported");
            }
            opts.input = arg;
        }
    }

    if (opts.help || opts.selftest) {
        return opts;
    }
    if ((opts.forward || !opts.goal.empty() || opts.list) && opts.rules_path.empty()) {
        throw std::runtime_error("--forward, --prove and --list require --rules");
    }
    if (opts.all && (opts.check || opts.eval || opts.true_rows)) {
        throw std::runtime_error("--all cannot be combined with --check, --eval or --true-rows");
    }
    if (opts.input.empty() && !opts.forward && opts.goal.empty() && !opts.list) {
        throw std::runtime_error("nothing to do (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] [<formula> | <formulas.txt>]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Propositional decision maker: truth tables, forward and backward chaining.\n"
        << "\n"
        << "Options:\n"
        << "  <formula> | <file.txt>   Formula, or file with one formula per line\n"
        << "  --selftest               Run built-in tests\n"
        << "  --rules <file>           Rule file ([domain] sections of key = value records)\n"
        << "  --domain <name>          Domain to load (default: first in the file)\n"
        << "  --facts A,B,...          Initial facts; 'NOT X' marks a negated fact\n"
        << "  --forward                Run forward chaining over the facts\n"
        << "  --prove <goal>           Run backward chaining for <goal>\n"
        << "  --cycle-guard path|shared  Cycle detection scope (default: path)\n"
        << "  --dot                    Print proof trees as Graphviz DOT\n"
        << "  --eval                   Evaluate formulas under --facts instead of tabulating\n"
        << "  --all                    One truth table over all input formulas\n"
        << "                           (not with --check, --eval or --true-rows)\n"
        << "  --true-rows              Only show rows where the formula holds\n"
        << "  --csv                    Print truth tables as CSV\n"
        << "  --check                  Z3 satisfiability/validity report\n"
        << "  --list                   Print the loaded rules\n"
        << "  --stats                  Show engine statistics\n"
        << "  --verbose, -v            Extra diagnostics on stderr\n"
        << "  --help, -h               Show this message\n"
        << "\n"
        << "Formula syntax: NOT ~  AND &  XOR  OR |  ->  <->  ( )\n"
        << "Input files: empty lines and '#' comments are ignored.\n";
}

// ── helpers ─────────────────────────────────────────────────────────────────

namespace {

struct InputFormula {
    std::uint32_t line = 0;
    std::string   text;
};

std::vector<InputFormula> read_formulas(const Options& opts) {
    std::vector<InputFormula> out;
    if (opts.input.empty()) {
        return out;
    }
    if (!opts.input.ends_with(".txt")) {
        out.push_back({1, opts.input});
        return out;
    }
    std::vector<std::string> lines = read_lines(opts.input);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (is_blank_or_comment(lines[i])) continue;
        out.push_back({static_cast<std::uint32_t>(i + 1), strip_comment(lines[i])});
    }
    return out;
}

void print_table(const TruthTable& table, const std::string& column, const Options& opts) {
    const TruthTable shown = opts.true_rows ? table.true_rows(column) : table;
    if (opts.csv) {
        std::cout << shown.to_csv();
    } else {
        std::cout << shown.to_string();
        std::cout << "(" << shown.rows.size() << " of 2^" << table.atoms.size()
                  << " rows)\n";
    }
}

void check_formula_size(const FormulaFactory& factory, FormulaId id) {
    std::size_t n = factory.atoms(id).size();
    if (n > kMaxTableAtoms) {
        throw std::runtime_error("too many atoms (" + std::to_string(n) +
                                 ") for a full truth table; use --eval");
    }
}

void report_check(SatChecker& checker, FormulaId id) {
    bool sat = checker.is_satisfiable(id);
    std::cout << "  " << sat_result_name(sat ? SatResult::Sat : SatResult::Unsat);
    if (sat && checker.is_valid(id)) {
        std::cout << " (valid)";
    }
    std::cout << "\n";
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    FormulaFactory factory;
    bool had_errors = false;

    // ── Load rules ──────────────────────────────────────────────────────
    RuleList rules;
    std::string domain = opts.domain;
    if (!opts.rules_path.empty()) {
        RuleBook book = read_rule_file(opts.rules_path);
        if (domain.empty() && !book.domains.empty()) {
            domain = book.domains.front();
        }
        if (!book.has_domain(domain)) {
            std::cerr << "WARNING: domain '" << domain << "' not found in "
                      << opts.rules_path << "\n";
        }
        rules = load_rule_set(book, domain, factory);
        if (opts.verbose) {
            std::cerr << "Loaded " << rules.size() << " rule(s) from domain '"
                      << domain << "'\n";
            for (const auto& r : rules) {
                std::cerr << "  " << r.id << ": " << factory.to_string(r.premise)
                          << " => " << factory.to_string(r.conclusion) << "\n";
            }
        }
    }

    AtomSet facts(opts.facts.begin(), opts.facts.end());

    if (opts.list) {
        RuleBook out;
        for (const auto& r : rules) {
            out.add(domain, to_record(r, factory));
        }
        std::cout << format_rule_book(out);
    }

    // ── Formulas ────────────────────────────────────────────────────────
    std::vector<InputFormula> inputs = read_formulas(opts);
    SatChecker checker(factory);

    if (opts.all && !inputs.empty()) {
        std::vector<NamedFormula> named;
        try {
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                FormulaId id = parse_formula(inputs[i].text, factory);
                named.push_back({"F" + std::to_string(i + 1), id});
                std::cout << named.back().name << " = " << factory.to_string(id) << "\n";
            }
            FormulaId combined = named.front().id;
            for (std::size_t i = 1; i < named.size(); ++i) {
                combined = factory.make_and(combined, named[i].id);
            }
            check_formula_size(factory, combined);
            TruthTable table = generate_truth_table(factory, named);
            print_table(table, named.front().name, opts);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            had_errors = true;
        }
    } else {
        for (const auto& in : inputs) {
            try {
                FormulaId id = parse_formula(in.text, factory);
                std::cout << in.line << ": " << factory.to_string(id) << "\n";

                if (opts.check) {
                    report_check(checker, id);
                } else if (opts.eval) {
                    Assignment a = assignment_from_facts(factory.atoms(id), facts);
                    std::cout << "  = " << (evaluate(factory, id, a) ? "True" : "False") << "\n";
                } else {
                    check_formula_size(factory, id);
                    TruthTable table = generate_truth_table(factory, {{"Formula", id}});
                    print_table(table, "Formula", opts);
                }
            } catch (const std::exception& e) {
                std::cerr << in.line << ": ERROR: " << e.what() << "\n";
                had_errors = true;
            }
        }
    }

    if (opts.check && !rules.empty()) {
        std::cout << "Rules consistent with facts: "
                  << (rules_consistent(factory, rules, facts) ? "yes" : "no") << "\n";
    }

    // ── Forward chaining ────────────────────────────────────────────────
    if (opts.forward) {
        ForwardChainer chainer(factory);
        ForwardResult result = chainer.run(facts, rules);

        std::cout << "Final facts: {" << join(result.final_facts, ", ") << "}\n";
        if (result.steps.empty()) {
            std::cout << "No rules fired.\n";
        }
        for (const auto& s : result.steps) {
            std::cout << "  " << s.explanation << "\n";
            if (opts.verbose) {
                std::cerr << "    inferred {" << join(s.inferred, ", ") << "}\n";
            }
        }
        for (const auto& c : result.contradictions) {
            std::cout << "CONTRADICTION: " << c.second << "\n";
        }
        if (opts.show_stats) {
            std::cout << "  Stats: " << chainer.stats().to_string() << "\n";
        }
    }

    // ── Backward chaining ───────────────────────────────────────────────
    if (!opts.goal.empty()) {
        BackwardChainer chainer(factory);
        chainer.set_cycle_guard(opts.cycle_guard);
        ProofNode proof = chainer.prove(opts.goal, facts, rules);

        if (opts.dot) {
            std::cout << proof.to_dot();
        } else {
            std::cout << (proof.succeeded ? "PROVED: " : "NOT PROVED: ") << opts.goal << "\n";
            std::cout << proof.to_string();
        }
        if (opts.show_stats) {
            std::cout << "  Stats: " << chainer.stats().to_string()
                      << " guard=" << cycle_guard_name(chainer.cycle_guard()) << "\n";
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace pdm
