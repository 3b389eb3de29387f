// ============================================================================
// test.cpp — Self-test suite for the propositional decision maker
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation (symbolic and word operators, positions, errors)
//   - Parser correctness (precedence, associativity, error reporting)
//   - Pretty-printing and parse/print round trips
//   - Evaluation and truth-table enumeration (ordering, filters, CSV)
//   - Rule loading and the rule-file format
//   - Forward chaining (fixpoint, trace, contradictions)
//   - Backward chaining (proof trees, cycles, guard strategies)
//   - Z3 cross-checks against truth tables
//
// ============================================================================

#include "pdm/test.hpp"
#include "pdm/ast.hpp"
#include "pdm/backward.hpp"
#include "pdm/cli.hpp"
#include "pdm/errors.hpp"
#include "pdm/evaluator.hpp"
#include "pdm/forward.hpp"
#include "pdm/lexer.hpp"
#include "pdm/parser.hpp"
#include "pdm/rules.hpp"
#include "pdm/truth_table.hpp"
#include "pdm/utils.hpp"
#include "pdm/z3_solver.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdm {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    return f.to_string(id);
}

static bool parse_fails(const std::string& input) {
    try {
        FormulaFactory f;
        parse_formula(input, f);
        return false;
    } catch (const SyntaxError&) {
        return true;
    }
}

static std::string syntax_message(const std::string& input) {
    try {
        FormulaFactory f;
        parse_formula(input, f);
    } catch (const SyntaxError& e) {
        return e.what();
    }
    return "";
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        out.push_back(line);
    }
    return out;
}

static RuleRecord record(const std::string& id, const std::string& premise,
                         const std::string& conclusion, const std::string& text) {
    return RuleRecord{{"id", id}, {"premise", premise},
                      {"conclusion", conclusion}, {"text", text}};
}

// A needs B and C, and both of those need D.
static RuleList diamond_rules(FormulaFactory& f) {
    return {
        make_rule("R1", "B AND C", "A", "A needs B and C", f),
        make_rule("R2", "D", "B", "B from D", f),
        make_rule("R3", "D", "C", "C from D", f),
        make_rule("R4", "E", "D", "D from E", f),
    };
}

// ============================================================================
// Lexer Tests
// ============================================================================

static void test_lexer_symbolic_ops(TestContext& ctx) {
    auto toks = tokenise("A & b | ~c -> d <-> e");
    ctx.check(toks.size() == 11, "11 tokens including EOF");
    ctx.check(toks[0].kind == TokenKind::Identifier && toks[0].text == "A", "identifier A");
    ctx.check(toks[1].kind == TokenKind::And, "& is AND");
    ctx.check(toks[3].kind == TokenKind::Or, "| is OR");
    ctx.check(toks[4].kind == TokenKind::Not, "~ is NOT");
    ctx.check(toks[6].kind == TokenKind::Implies, "-> is IMPLIES");
    ctx.check(toks[8].kind == TokenKind::Iff, "<-> is IFF, not < then ->");
    ctx.check(toks[10].kind == TokenKind::Eof, "terminated by EOF");
    ctx.check(toks[6].pos == 11, "-> at offset 11");
    ctx.check(toks[8].pos == 16, "<-> at offset 16");
    ctx.check(toks[10].pos == 21, "EOF at end of input");
}

static void test_lexer_word_keywords(TestContext& ctx) {
    auto toks = tokenise("a and OR xor Not");
    ctx.check(toks[0].kind == TokenKind::Identifier, "a is an identifier");
    ctx.check(toks[1].kind == TokenKind::And && toks[1].text == "and", "and lowercase");
    ctx.check(toks[2].kind == TokenKind::Or, "OR uppercase");
    ctx.check(toks[3].kind == TokenKind::Xor, "xor lowercase");
    ctx.check(toks[4].kind == TokenKind::Not, "Not mixed case");

    auto ids = tokenise("Rain_1 andy NOTE");
    ctx.check(ids[0].kind == TokenKind::Identifier && ids[0].text == "Rain_1",
              "digits and underscore in identifiers");
    ctx.check(ids[1].kind == TokenKind::Identifier, "andy is not AND");
    ctx.check(ids[2].kind == TokenKind::Identifier && ids[2].text == "NOTE",
              "NOTE is not NOT");
}

static void test_lexer_errors(TestContext& ctx) {
    try {
        tokenise("a $ b");
        ctx.check(false, "'$' rejected");
    } catch (const SyntaxError& e) {
        ctx.check(e.position() == 2, "'$' reported at position 2");
        ctx.check_eq(e.what(), "unexpected character '$' at position 2", "'$' message");
    }
    ctx.check_throws<SyntaxError>([] { tokenise("a - b"); }, "lone '-' rejected");
    ctx.check_throws<SyntaxError>([] { tokenise("a < b"); }, "lone '<' rejected");
    ctx.check(tokenise("   ").size() == 1, "whitespace only gives just EOF");
}

static void test_lexer_peek(TestContext& ctx) {
    Lexer lex("x AND y");
    ctx.check(lex.peek().kind == TokenKind::Identifier, "peek sees x");
    ctx.check(lex.peek().text == "x", "peek is idempotent");
    ctx.check(lex.next().text == "x", "next returns the peeked token");
    ctx.check(lex.next().kind == TokenKind::And, "then AND");
    ctx.check(lex.next().text == "y", "then y");
    ctx.check(lex.next().kind == TokenKind::Eof, "then EOF");
    ctx.check(lex.next().kind == TokenKind::Eof, "EOF repeats");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_precedence(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("a AND b OR c", f);
    ctx.check(f.node(id).kind == NodeKind::Or, "OR at the root of a AND b OR c");
    ctx.check(f.node(f.node(id).children[0]).kind == NodeKind::And, "AND binds tighter");

    id = parse_formula("a OR b XOR c", f);
    ctx.check(f.node(id).kind == NodeKind::Or, "OR looser than XOR");
    ctx.check(f.node(f.node(id).children[1]).kind == NodeKind::Xor, "XOR on the right");

    id = parse_formula("a <-> b -> c", f);
    ctx.check(f.node(id).kind == NodeKind::Iff, "IFF loosest");

    id = parse_formula("NOT a AND b", f);
    ctx.check(f.node(id).kind == NodeKind::And, "NOT binds tighter than AND");
    ctx.check(f.node(f.node(id).children[0]).kind == NodeKind::Not, "NOT a on the left");

    id = parse_formula("a -> b -> c", f);
    ctx.check(f.node(f.node(id).children[0]).kind == NodeKind::Implies,
              "-> folds to the left");
}

static void test_parse_print(TestContext& ctx) {
    ctx.check_eq(pp("a"), "a", "atom");
    ctx.check_eq(pp("a and b"), "a AND b", "keywords printed uppercase");
    ctx.check_eq(pp("~a & b"), "NOT a AND b", "symbolic operators");
    ctx.check_eq(pp("~(a & b)"), "NOT (a AND b)", "negated group");
    ctx.check_eq(pp("NOT NOT a"), "NOT NOT a", "double negation kept");
    ctx.check_eq(pp("((a))"), "a", "redundant parentheses dropped");
    ctx.check_eq(pp("(a AND b) OR c"), "a AND b OR c", "no parens for tighter child");
    ctx.check_eq(pp("a AND (b OR c)"), "a AND (b OR c)", "parens for looser child");
    ctx.check_eq(pp("(a OR b) XOR c"), "(a OR b) XOR c", "OR under XOR");
    ctx.check_eq(pp("a XOR b AND c"), "a XOR b AND c", "AND under XOR");
    ctx.check_eq(pp("a -> b -> c"), "a -> b -> c", "left-nested implication");
    ctx.check_eq(pp("a -> (b -> c)"), "a -> (b -> c)", "right-nested implication");
    ctx.check_eq(pp("a AND (b AND c)"), "a AND (b AND c)", "right-nested AND");
    ctx.check_eq(pp("a <-> b -> c"), "a <-> b -> c", "implication under IFF");
}

static void test_parse_round_trip(TestContext& ctx) {
    const std::vector<std::string> inputs = {
        "a",
        "NOT a",
        "a AND b OR c",
        "a AND (b OR c)",
        "(a -> b) -> c",
        "a -> (b -> c)",
        "a <-> (b <-> c)",
        "NOT (a XOR b) OR c AND NOT d",
        "(Fever AND Cough) -> (Flu OR Cold)",
        "~~(p | q) & (r <-> ~s)",
        "a XOR (b XOR c) XOR d",
    };
    FormulaFactory f;
    for (const auto& in : inputs) {
        FormulaId id = parse_formula(in, f);
        std::string printed = f.to_string(id);
        ctx.check(parse_formula(printed, f) == id, "round trip of " + in);
        ctx.check_eq(f.to_string(parse_formula(printed, f)), printed,
                     "printing is stable for " + in);
    }
}

static void test_parse_errors(TestContext& ctx) {
    ctx.check_throws<SyntaxError>([] {
        FormulaFactory f;
        parse_formula("A AND AND B", f);
    }, "A AND AND B raises SyntaxError");
    ctx.check_eq(syntax_message("A AND AND B"),
                 "expected IDENT or ( but found AND at position 6", "A AND AND B message");
    ctx.check_eq(syntax_message("(a"), "expected ) but found EOF at position 2",
                 "unclosed parenthesis");
    ctx.check_eq(syntax_message("a)"),
                 "unexpected token ')' after complete formula at position 1",
                 "trailing parenthesis");
    ctx.check_eq(syntax_message("a b"),
                 "unexpected token 'b' after complete formula at position 2",
                 "two atoms without operator");
    ctx.check(parse_fails(""), "empty input");
    ctx.check(parse_fails("AND a"), "leading binary operator");
    ctx.check(parse_fails("a ->"), "missing right operand");
    ctx.check(parse_fails("NOT"), "NOT without operand");
    ctx.check(parse_fails("()"), "empty parentheses");
    ctx.check(!parse_fails("a"), "single atom parses");
}

static std::string repeat(const std::string& piece, std::size_t n) {
    std::string out;
    out.reserve(piece.size() * n);
    for (std::size_t i = 0; i < n; ++i) out += piece;
    return out;
}

static void test_parse_depth_limits(TestContext& ctx) {
    FormulaFactory f;
    ctx.check(f.node(parse_formula("a AND (b OR NOT c)", f)).depth == 4, "node depth");

    const std::string ok_parens = repeat("(", kMaxNesting) + "a" + repeat(")", kMaxNesting);
    ctx.check(parse_formula(ok_parens, f) == f.make_atom("a"), "deepest allowed nesting");

    const std::string deep_parens =
        repeat("(", kMaxNesting + 1) + "a" + repeat(")", kMaxNesting + 1);
    ctx.check_eq(syntax_message(deep_parens),
                 "formula nested more than 1000 levels deep at position 1000",
                 "over-nested parentheses fail cleanly");
    ctx.check(parse_fails(repeat("(", 200000) + "a"), "runaway parentheses fail cleanly");
    ctx.check(parse_fails(repeat("NOT ", kMaxNesting + 1) + "a"), "runaway NOT chain");

    const std::string ok_chain = "a" + repeat(" AND a", kMaxFormulaDepth - 1);
    ctx.check(f.node(parse_formula(ok_chain, f)).depth == kMaxFormulaDepth,
              "longest allowed operator chain");
    ctx.check(parse_fails("a" + repeat(" AND a", kMaxFormulaDepth)),
              "operator chain one level too deep");
}

static void test_try_parse(TestContext& ctx) {
    FormulaFactory f;
    ParseError err;

    auto ok = try_parse_formula("a OR b", f, err);
    ctx.check(ok.has_value(), "valid formula gives a value");
    ctx.check(ok && f.to_string(*ok) == "a OR b", "value is the parsed formula");

    auto bad = try_parse_formula("a OR", f, err);
    ctx.check(!bad.has_value(), "invalid formula gives no value");
    ctx.check(err.position == 4, "error position recorded");
    ctx.check_eq(err.message, "expected IDENT or ( but found EOF at position 4",
                 "error message recorded");

    auto lex_bad = try_parse_formula("a ? b", f, err);
    ctx.check(!lex_bad.has_value(), "lexer failure also reported");
    ctx.check(err.position == 2, "lexer error position");
}

// ============================================================================
// AST Tests
// ============================================================================

static void test_factory_interning(TestContext& ctx) {
    FormulaFactory f;
    FormulaId a1 = f.make_atom("a");
    FormulaId a2 = f.make_atom("a");
    ctx.check(a1 == a2, "atoms are interned");
    ctx.check(f.make_atom("A") != a1, "atom names are case sensitive");

    FormulaId b = f.make_atom("b");
    ctx.check(f.make_and(a1, b) == f.make_and(a2, b), "compound nodes are interned");
    ctx.check(f.make_and(a1, b) != f.make_and(b, a1), "operand order matters");
    ctx.check(f.make_binary(NodeKind::Xor, a1, b) == f.make_xor(a1, b), "make_binary");

    std::size_t before = f.node_count();
    parse_formula("a AND b", f);
    ctx.check(f.node_count() == before, "parsing an existing formula adds no nodes");

    AtomSet atoms = f.atoms(parse_formula("(c OR a) -> NOT (b AND a)", f));
    ctx.check(atoms == AtomSet{"a", "b", "c"}, "atoms are the sorted union");

    ctx.check_throws<InternalError>([&] { f.make_binary(NodeKind::Not, a1, b); },
                                    "make_binary rejects NOT");
    ctx.check_throws<InternalError>([&] { f.node(kInvalidId); },
                                    "invalid id rejected");
}

// ============================================================================
// Evaluator Tests
// ============================================================================

static void test_evaluate_literals(TestContext& ctx) {
    FormulaFactory f;
    FormulaId a = f.make_atom("A");
    FormulaId b = f.make_atom("B");
    FormulaId a_and_not_b = f.make_and(a, f.make_not(b));
    FormulaId a_implies_b = f.make_implies(a, b);

    ctx.check(evaluate(f, a_and_not_b, {{"A", true}, {"B", false}}),
              "A AND NOT B with A=1 B=0");
    ctx.check(!evaluate(f, a_and_not_b, {{"A", true}, {"B", true}}),
              "A AND NOT B with A=1 B=1");
    ctx.check(evaluate(f, a_implies_b, {{"A", false}, {"B", false}}),
              "A -> B with A=0 B=0");
    ctx.check(!evaluate(f, a_implies_b, {{"A", true}, {"B", false}}),
              "A -> B with A=1 B=0");

    ctx.check(!evaluate(f, a, {}), "missing atom is false");
    ctx.check(evaluate(f, f.make_not(a), {}), "NOT of missing atom is true");
}

static void test_evaluate_connectives(TestContext& ctx) {
    FormulaFactory f;
    FormulaId x = parse_formula("p XOR q", f);
    FormulaId e = parse_formula("p <-> q", f);
    FormulaId o = parse_formula("p OR q", f);

    for (int p = 0; p < 2; ++p) {
        for (int q = 0; q < 2; ++q) {
            Assignment a{{"p", p == 1}, {"q", q == 1}};
            std::string tag = " p=" + std::to_string(p) + " q=" + std::to_string(q);
            ctx.check(evaluate(f, x, a) == (p != q), "XOR" + tag);
            ctx.check(evaluate(f, e, a) == (p == q), "IFF" + tag);
            ctx.check(evaluate(f, o, a) == (p == 1 || q == 1), "OR" + tag);
        }
    }

    Assignment a = assignment_from_facts({"A", "B"}, {"A", "C"});
    ctx.check(a.size() == 2, "assignment covers exactly the given atoms");
    ctx.check(a.at("A") && !a.at("B"), "facts map to true, others to false");
}

// ============================================================================
// Truth Table Tests
// ============================================================================

static void test_truth_table_rows(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("a AND b", f);
    TruthTable t = generate_truth_table(f, {{"F", id}});

    ctx.check(t.atoms == std::vector<std::string>{"a", "b"}, "atoms sorted");
    ctx.check(t.rows.size() == 4, "2^2 rows");
    ctx.check(!t.rows[0].atom_values[0] && !t.rows[0].atom_values[1], "row 0 all false");
    ctx.check(!t.rows[1].atom_values[0] && t.rows[1].atom_values[1],
              "last atom varies fastest");
    ctx.check(t.rows[3].atom_values[0] && t.rows[3].atom_values[1], "row 3 all true");
    ctx.check(t.rows[3].formula_values[0], "a AND b true in row 3");
    ctx.check(!t.rows[2].formula_values[0], "a AND b false in row 2");

    FormulaId big = parse_formula("(a OR b) -> (c XOR d) AND e", f);
    TruthTable t5 = generate_truth_table(f, {{"G", big}});
    ctx.check(t5.rows.size() == 32, "2^5 rows");
    std::set<std::vector<bool>> unique;
    for (const auto& r : t5.rows) unique.insert(r.atom_values);
    ctx.check(unique.size() == 32, "every assignment appears once");

    TruthTable empty = generate_truth_table(f, {});
    ctx.check(empty.atoms.empty() && empty.rows.size() == 1, "no atoms gives one row");

    Assignment a = t.assignment(2);
    ctx.check(a.at("a") && !a.at("b"), "assignment of row 2");
}

static void test_truth_table_options(TestContext& ctx) {
    FormulaFactory f;
    FormulaId a_or_b = parse_formula("a OR b", f);

    TruthTableOptions explicit_atoms;
    explicit_atoms.atoms = std::vector<std::string>{"b", "a", "b", "c"};
    TruthTable t = generate_truth_table(f, {{"F", a_or_b}}, explicit_atoms);
    ctx.check(t.atoms == std::vector<std::string>{"b", "a", "c"},
              "explicit order kept, duplicates dropped");
    ctx.check(t.rows.size() == 8, "extra atom doubles the rows");

    TruthTableOptions filtered;
    filtered.filter = NamedFormula{"G", parse_formula("a", f)};
    TruthTable tf = generate_truth_table(f, {{"F", a_or_b}}, filtered);
    ctx.check(tf.columns == std::vector<std::string>{"F", "G"}, "filter column appended");
    ctx.check(tf.rows.size() == 2, "only rows where a holds");
    bool all_a = true;
    for (std::size_t i = 0; i < tf.rows.size(); ++i) {
        all_a = all_a && tf.assignment(i).at("a");
    }
    ctx.check(all_a, "filtered rows all satisfy the filter");

    TruthTableOptions filter_atoms;
    filter_atoms.filter = NamedFormula{"H", parse_formula("c", f)};
    TruthTable tc = generate_truth_table(f, {{"F", a_or_b}}, filter_atoms);
    ctx.check(tc.atoms == std::vector<std::string>{"a", "b", "c"},
              "filter atoms join the default atom list");

    TruthTableOptions too_many;
    std::vector<std::string> names;
    for (int i = 0; i < 63; ++i) names.push_back("x" + std::to_string(i));
    too_many.atoms = names;
    ctx.check_throws<std::length_error>([&] { generate_truth_table(f, {}, too_many); },
                                        "63 atoms cannot be enumerated");
}

static void test_truth_table_render(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("p", f);
    TruthTable t = generate_truth_table(f, {{"Formula", id}});

    std::vector<std::string> lines = split_lines(t.to_string());
    ctx.check(lines.size() == 4, "header, rule, two rows");
    ctx.check_eq(lines[0], "p | Formula", "text header");
    ctx.check_eq(lines[1], "--+--------", "text separator");
    ctx.check_eq(lines[2], "F | F      ", "first row padded");

    ctx.check_eq(t.to_csv(), "\"p\",\"Formula\"\nfalse,false\ntrue,true\n", "csv");

    FormulaId q = parse_formula("a OR b", f);
    TruthTable tq = generate_truth_table(f, {{"say \"hi\"", q}});
    ctx.check(tq.to_csv().starts_with("\"a\",\"b\",\"say \"\"hi\"\"\"\n"),
              "csv header escapes quotes");

    TruthTable only = tq.true_rows("say \"hi\"");
    ctx.check(only.rows.size() == 3, "a OR b has three true rows");
    ctx.check_throws<std::out_of_range>([&] { tq.true_rows("missing"); },
                                        "unknown column rejected");
}

// ============================================================================
// Rule Tests
// ============================================================================

static void test_rules_load(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = load_rules({record("R1", "Fever AND Cough", "Flu", "Flu suspected"),
                                 record("R2", "Flu", "Rest", "Rest advised")}, f);
    ctx.check(rules.size() == 2, "two rules loaded");
    ctx.check_eq(rules[0].id, "R1", "first id");
    ctx.check_eq(f.to_string(rules[0].premise), "Fever AND Cough", "premise parsed");
    ctx.check(rules[0].premise_atoms(f) == AtomSet{"Cough", "Fever"}, "premise atoms");
    ctx.check(rule_atoms(rules, f) == AtomSet{"Cough", "Fever", "Flu", "Rest"},
              "rule atoms");

    RuleRecord back = to_record(rules[1], f);
    ctx.check_eq(back.at("conclusion"), "Rest", "to_record conclusion");
    ctx.check_eq(back.at("text"), "Rest advised", "to_record text");

    try {
        RuleRecord r = record("R9", "A", "B", "x");
        r.erase("text");
        load_rules({r}, f);
        ctx.check(false, "missing text rejected");
    } catch (const RuleLoadError& e) {
        ctx.check_eq(e.what(), "rule 'R9' is missing required field 'text'",
                     "missing field message");
    }
    try {
        RuleRecord r = record("R9", "A", "B", "x");
        r.erase("id");
        load_rules({record("R1", "A", "B", "x"), r}, f);
        ctx.check(false, "missing id rejected");
    } catch (const RuleLoadError& e) {
        ctx.check_eq(e.what(), "rule #2 is missing required field 'id'",
                     "anonymous rule named by index");
    }
    try {
        load_rules({record("R3", "A AND", "B", "x")}, f);
        ctx.check(false, "bad premise rejected");
    } catch (const RuleLoadError& e) {
        ctx.check(std::string(e.what()).starts_with("rule 'R3': premise: "),
                  "bad premise message names the rule and field");
    }
}

static void test_rule_file(TestContext& ctx) {
    const std::vector<std::string> lines = {
        "# sample rules",
        "[medical]",
        "id         = R1",
        "premise    = Fever AND Cough",
        "conclusion = Flu",
        "text       = Flu suspected",
        "",
        "id = R2",
        "premise = Flu",
        "conclusion = Rest   # trailing comment",
        "text = Rest advised",
        "[loan]",
        "id = L1",
        "premise = Income AND NOT Debt",
        "conclusion = Approve",
        "text = Loan approved",
    };
    RuleBook book = parse_rule_book(lines);
    ctx.check(book.domains == std::vector<std::string>{"medical", "loan"}, "domain order");
    ctx.check(book.records.at("medical").size() == 2, "two medical records");
    ctx.check_eq(book.records.at("medical")[1].at("conclusion"), "Rest",
                 "comment stripped from value");

    FormulaFactory f;
    RuleList loan = load_rule_set(book, "loan", f);
    ctx.check(loan.size() == 1 && loan[0].id == "L1", "loan domain loaded");
    ctx.check(load_rule_set(book, "tax", f).empty(), "absent domain is empty");

    RuleBook again = parse_rule_book(split_lines(format_rule_book(book)));
    ctx.check(again.domains == book.domains, "format keeps domains");
    ctx.check(again.records == book.records, "format keeps records");
    ctx.check(split_lines(format_rule_book(book))[1] == "id         = R1",
              "keys padded");

    RuleBook plain = parse_rule_book({"id = X1", "premise = A", "conclusion = B", "text = t"});
    ctx.check(plain.domains == std::vector<std::string>{"default"}, "default domain");

    auto fails_with = [&](const std::vector<std::string>& bad, const std::string& msg) {
        try {
            parse_rule_book(bad);
            ctx.check(false, "rejected: " + msg);
        } catch (const RuleLoadError& e) {
            ctx.check_eq(e.what(), msg, "rule file error");
        }
    };
    fails_with({"[medical"}, "line 1: unterminated domain header '[medical'");
    fails_with({"[ ]"}, "line 1: empty domain name");
    fails_with({"id = R1", "premise A"}, "line 2: expected 'key = value', got 'premise A'");
    fails_with({"id = R1", "weight = 3"}, "line 2: unknown key 'weight'");
    fails_with({"id = R1", "text = a", "text = b"}, "line 3: duplicate key 'text'");

    const auto path = std::filesystem::temp_directory_path() / "pdm_selftest_rules.txt";
    {
        std::ofstream out(path);
        for (const auto& l : lines) out << l << "\n";
    }
    RuleBook from_disk = read_rule_file(path.string());
    std::filesystem::remove(path);
    ctx.check(from_disk.records == book.records, "read_rule_file matches parse_rule_book");
    ctx.check_throws<std::runtime_error>([&] { read_rule_file(path.string()); },
                                         "missing file rejected");
}

static void test_rule_file_special_text(TestContext& ctx) {
    FormulaFactory f;
    RuleBook book;
    book.add("scoring", to_record(make_rule("R2", "A", "B", "Score #1 applies", f), f));
    book.add("scoring", to_record(make_rule("R3", "B", "C", "first line\nsecond line = x", f), f));
    book.add("scoring", to_record(make_rule("R4", "C", "D", "path C:\\tmp\\#x", f), f));

    std::string text = format_rule_book(book);
    ctx.check(text.find("text       = Score \\#1 applies\n") != std::string::npos,
              "'#' escaped on write");

    RuleBook again = parse_rule_book(split_lines(text));
    ctx.check(again.records == book.records, "descriptions with '#', newline and '\\' survive");
    ctx.check_eq(again.records.at("scoring")[0].at("text"), "Score #1 applies", "hash kept");
    ctx.check_eq(again.records.at("scoring")[1].at("text"), "first line\nsecond line = x",
                 "newline kept");

    RuleList rules = load_rule_set(again, "scoring", f);
    ctx.check(rules.size() == 3 && rules[0].description == "Score #1 applies",
              "reloaded rules carry the full description");

    RuleBook hand = parse_rule_book({"id = H1", "premise = A", "conclusion = B",
                                     "text = a \\q b  # comment"});
    ctx.check_eq(hand.records.at("default")[0].at("text"), "a \\q b",
                 "unknown escape kept verbatim");

    RuleBook bad;
    bad.add("odd#name", record("R1", "A", "B", "t"));
    ctx.check_throws<RuleLoadError>([&] { format_rule_book(bad); },
                                    "unwritable domain name rejected");
}

// ============================================================================
// Forward Chaining Tests
// ============================================================================

static void test_forward_single_rule(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = {make_rule("R1", "A AND B", "C", "", f)};
    ForwardResult r = forward_chain(f, {"A", "B"}, rules);

    ctx.check(r.final_facts == AtomSet{"A", "B", "C"}, "C inferred");
    ctx.check(r.steps.size() == 1, "exactly one step");
    ctx.check(r.steps[0].step == 1, "steps are 1-based");
    ctx.check_eq(r.steps[0].rule_id, "R1", "R1 fired");
    ctx.check(r.steps[0].inferred == AtomSet{"C"}, "inferred {C}");
    ctx.check_eq(r.steps[0].explanation,
                 "Step 1: R1 fired because A and B are True -> inferred C.",
                 "explanation text");
    ctx.check(r.contradictions.empty(), "no contradictions");

    ForwardResult none = forward_chain(f, {"A"}, rules);
    ctx.check(none.steps.empty() && none.final_facts == AtomSet{"A"},
              "premise false: nothing fires");
}

static void test_forward_chain_fixpoint(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = {
        make_rule("R3", "C AND D", "E", "", f),
        make_rule("R1", "A", "B", "", f),
        make_rule("R2", "B", "C OR D", "", f),
    };
    ForwardChainer chainer(f);
    ForwardResult r = chainer.run({"A"}, rules);

    ctx.check(r.final_facts == AtomSet{"A", "B", "C", "D", "E"}, "chain reaches E");
    ctx.check(r.steps.size() == 3, "three firings");
    ctx.check_eq(r.steps[0].rule_id, "R1", "R1 first");
    ctx.check(r.steps[1].inferred == AtomSet{"C", "D"},
              "each disjunct is newly satisfiable on its own");
    ctx.check_eq(r.steps[2].rule_id, "R3", "R3 in the second pass");
    ctx.check(chainer.stats().passes == 3, "third pass fires nothing");
    ctx.check(chainer.stats().firings == 3, "firing count");
    ctx.check(chainer.stats().premise_evaluations == 9, "every rule evaluated per pass");

    ForwardResult again = chainer.run({"A"}, rules);
    ctx.check(again.final_facts == r.final_facts, "repeated run gives same facts");
    ctx.check(again.steps.size() == r.steps.size(), "repeated run gives same trace");

    bool superset = true;
    for (const auto& a : AtomSet{"A"}) superset = superset && r.final_facts.count(a) > 0;
    ctx.check(superset, "final facts contain the initial facts");
}

static void test_forward_negated_conclusion(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = {
        make_rule("R1", "A", "NOT B", "", f),
        make_rule("R2", "A", "B AND C", "", f),
    };
    ForwardResult r = forward_chain(f, {"A"}, rules);
    ctx.check(r.final_facts == AtomSet{"A"},
              "neither a negation nor a two-atom conjunction is satisfied by one atom");

    ForwardResult r2 = forward_chain(f, {"A", "B"}, rules);
    ctx.check(r2.final_facts == AtomSet{"A", "B", "C"},
              "conjunction completed when the other conjunct already holds");

    // Conclusion atoms are tested against every current fact, not only the
    // premise atoms: C is a fact but not in the premise.
    ForwardResult r3 = forward_chain(f, {"A", "C"}, {make_rule("R3", "A", "B AND C", "", f)});
    ctx.check(r3.final_facts == AtomSet{"A", "B", "C"},
              "conjunct outside the premise still counts toward the conclusion");
    ctx.check(r3.steps.size() == 1 && r3.steps[0].inferred == AtomSet{"B"},
              "only B is inferred");
}

static void test_contradictions(TestContext& ctx) {
    auto c = detect_contradictions({"Flu", "NOT Flu"});
    ctx.check(c.size() == 1, "one contradiction");
    ctx.check_eq(c[0].first, "Flu", "atom Flu");
    ctx.check_eq(c[0].second, "Contradiction between Flu and NOT Flu", "message");

    auto many = detect_contradictions({"b", "NOT b", "a", "NOT a", "NOT c", "d"});
    ctx.check(many.size() == 2, "two contradictions");
    ctx.check(many[0].first == "a" && many[1].first == "b", "sorted by atom");
    ctx.check(detect_contradictions({}).empty(), "empty facts");
    ctx.check(detect_contradictions({"NOTFlu", "Flu"}).empty(), "prefix needs the space");

    FormulaFactory f;
    RuleList rules = {make_rule("R1", "Fever", "Flu", "", f)};
    ForwardResult r = forward_chain(f, {"Fever", "NOT Flu"}, rules);
    ctx.check(r.contradictions.size() == 1, "forward run reports the contradiction");
}

// ============================================================================
// Backward Chaining Tests
// ============================================================================

static void test_backward_success(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = {make_rule("R1", "A AND B", "C", "", f)};
    ProofNode p = backward_chain(f, "C", {"A", "B"}, rules);

    ctx.check(p.succeeded, "C proved");
    ctx.check(p.rule_id && *p.rule_id == "R1", "via R1");
    ctx.check(p.premises.size() == 2, "two premises");
    ctx.check(p.premises[0].goal == "A" && p.premises[1].goal == "B", "premises sorted");
    for (const auto& child : p.premises) {
        ctx.check(child.succeeded, "premise " + child.goal + " succeeded");
        ctx.check_eq(child.message, "Given as a fact.", "premise " + child.goal + " is a fact");
        ctx.check(!child.rule_id, "fact has no rule");
    }
    ctx.check_eq(p.message, "Proved C using rule R1.", "success message");

    ctx.check_eq(p.to_string(),
                 "[+] C (rule R1): Proved C using rule R1.\n"
                 "  [+] A: Given as a fact.\n"
                 "  [+] B: Given as a fact.\n",
                 "text rendering");
    std::string dot = p.to_dot();
    ctx.check(dot.starts_with("digraph ProofTree {"), "dot header");
    ctx.check(dot.find("n0 -> n1;") != std::string::npos, "dot edge to first premise");
    ctx.check(dot.find("n0 -> n2;") != std::string::npos, "dot edge to second premise");

    ProofNode fact = backward_chain(f, "A", {"A"}, rules);
    ctx.check(fact.succeeded && fact.premises.empty(), "goal that is a fact");
}

static void test_backward_failure(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = {make_rule("R1", "A AND B", "C", "", f)};

    ProofNode z = backward_chain(f, "Z", {"A"}, rules);
    ctx.check(!z.succeeded, "Z not proved");
    ctx.check(z.premises.empty(), "no premises");
    ctx.check(!z.rule_id, "no rule");
    ctx.check_eq(z.message, "No rules conclude this goal.", "no rule message");

    ProofNode c = backward_chain(f, "C", {"A"}, rules);
    ctx.check(!c.succeeded, "C not proved without B");
    ctx.check_eq(c.message, "All applicable rules failed to prove this goal.",
                 "all rules failed");

    RuleList alt = {
        make_rule("R1", "A AND B", "C", "", f),
        make_rule("R2", "D", "C", "", f),
    };
    ProofNode second = backward_chain(f, "C", {"D"}, alt);
    ctx.check(second.succeeded && second.rule_id && *second.rule_id == "R2",
              "falls through to the second rule");
    ctx.check(second.premises.size() == 1, "failed attempt not kept");
}

static void test_backward_cycle(TestContext& ctx) {
    FormulaFactory f;
    RuleList self = {make_rule("R1", "X", "X", "", f)};
    BackwardChainer chainer(f);
    ProofNode p = chainer.prove("X", {}, self);
    ctx.check(!p.succeeded, "X -> X does not prove X");
    ctx.check(chainer.stats().cycles_detected == 1, "cycle detected once");

    RuleList loop = {
        make_rule("R1", "Q", "P", "", f),
        make_rule("R2", "P", "Q", "", f),
    };
    ProofNode pq = chainer.prove("P", {}, loop);
    ctx.check(!pq.succeeded, "mutual recursion fails");
    ctx.check(chainer.stats().max_depth == 2, "P -> Q -> P depth");

    ProofNode with_fact = chainer.prove("P", {"Q"}, loop);
    ctx.check(with_fact.succeeded, "cycle broken by a fact");
}

static void test_backward_guard_strategies(TestContext& ctx) {
    FormulaFactory f;
    RuleList rules = diamond_rules(f);

    BackwardChainer chainer(f);
    ctx.check(chainer.cycle_guard() == CycleGuard::PerPath, "per-path is the default");

    ProofNode per_path = chainer.prove("A", {"E"}, rules);
    ctx.check(per_path.succeeded, "per-path guard proves A through both branches");
    ctx.check(chainer.stats().cycles_detected == 0, "no cycles on a diamond");

    chainer.set_cycle_guard(CycleGuard::Shared);
    ProofNode shared = chainer.prove("A", {"E"}, rules);
    ctx.check(!shared.succeeded, "shared guard blocks D in the second branch");
    ctx.check(chainer.stats().cycles_detected == 1, "second visit of D counted as a cycle");
    ctx.check_eq(cycle_guard_name(chainer.cycle_guard()), "shared", "guard name");

    ProofNode wrapped = backward_chain(f, "A", {"E"}, rules, CycleGuard::Shared);
    ctx.check(!wrapped.succeeded, "wrapper honours the guard");
}

// ============================================================================
// Z3 Tests
// ============================================================================

static void test_z3_matches_truth_table(TestContext& ctx) {
    const std::vector<std::string> inputs = {
        "a AND NOT a",
        "a OR NOT a",
        "a XOR b",
        "(a -> b) AND a AND NOT b",
        "(a <-> b) <-> (NOT a <-> NOT b)",
        "(p OR q) AND (NOT p OR r) AND NOT q AND NOT r",
    };
    FormulaFactory f;
    SatChecker checker(f);
    for (const auto& in : inputs) {
        FormulaId id = parse_formula(in, f);
        TruthTable t = generate_truth_table(f, {{"F", id}});
        std::size_t true_rows = t.true_rows("F").rows.size();
        ctx.check(checker.is_satisfiable(id) == (true_rows > 0), "satisfiable: " + in);
        ctx.check(checker.is_valid(id) == (true_rows == t.rows.size()), "valid: " + in);
    }
}

static void test_z3_checker(TestContext& ctx) {
    FormulaFactory f;
    SatChecker checker(f);

    ctx.check(checker.equivalent(parse_formula("a -> b", f),
                                 parse_formula("NOT a OR b", f)),
              "implication as disjunction");
    ctx.check(!checker.equivalent(parse_formula("a -> b", f),
                                  parse_formula("b -> a", f)),
              "converse is not equivalent");

    checker.add_formula(parse_formula("a AND NOT b", f));
    ctx.check(checker.check() == SatResult::Sat, "a AND NOT b is satisfiable");
    Assignment m = checker.model();
    ctx.check(m.at("a") && !m.at("b"), "model values");

    checker.add_fact("b");
    ctx.check(checker.check() == SatResult::Unsat, "fact b contradicts");
    ctx.check_throws<std::runtime_error>([&] { checker.model(); }, "no model when unsat");
    ctx.check_eq(sat_result_name(SatResult::Unsat), "UNSATISFIABLE", "result name");

    checker.reset();
    ctx.check(checker.check() == SatResult::Sat, "reset clears assertions");

    RuleList rules = {make_rule("R1", "A", "B", "", f)};
    ctx.check(rules_consistent(f, rules, {"A"}), "A with A -> B");
    ctx.check(!rules_consistent(f, rules, {"A", "NOT B"}), "A, NOT B with A -> B");
}

// ============================================================================
// CLI Tests
// ============================================================================

static Options args(std::vector<std::string> words) {
    words.insert(words.begin(), "pdm");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static void test_cli_args(TestContext& ctx) {
    Options o = args({"--rules", "r.txt", "--facts", "A, NOT B", "--prove", "C",
                      "--cycle-guard", "shared", "--stats"});
    ctx.check_eq(o.rules_path, "r.txt", "--rules");
    ctx.check(o.facts == std::vector<std::string>{"A", "NOT B"}, "--facts split");
    ctx.check_eq(o.goal, "C", "--prove");
    ctx.check(o.cycle_guard == CycleGuard::Shared, "--cycle-guard shared");
    ctx.check(o.show_stats, "--stats");

    Options t = args({"formulas.txt", "--all", "--csv"});
    ctx.check(t.all && t.csv && t.input == "formulas.txt", "--all with --csv");

    ctx.check_throws<std::runtime_error>([] { args({"a.txt", "--all", "--check"}); },
                                         "--all with --check rejected");
    ctx.check_throws<std::runtime_error>([] { args({"a.txt", "--all", "--eval"}); },
                                         "--all with --eval rejected");
    ctx.check_throws<std::runtime_error>([] { args({"a.txt", "--all", "--true-rows"}); },
                                         "--all with --true-rows rejected");
    ctx.check_throws<std::runtime_error>([] { args({"--forward"}); },
                                         "--forward needs --rules");
    ctx.check_throws<std::runtime_error>([] { args({"a", "--cycle-guard", "tree"}); },
                                         "unknown guard rejected");
    ctx.check_throws<std::runtime_error>([] { args({"a", "--bogus"}); },
                                         "unknown option rejected");
    ctx.check(args({"--selftest"}).selftest, "--selftest alone is enough");
}

// ============================================================================
// Utility Tests
// ============================================================================

static void test_utils(TestContext& ctx) {
    ctx.check_eq(trim("  a b \t"), "a b", "trim");
    ctx.check_eq(strip_comment("a AND b  # note"), "a AND b", "strip_comment");
    ctx.check(is_blank_or_comment("   # only a comment"), "comment line");
    ctx.check(!is_blank_or_comment(" x "), "content line");
    ctx.check(split_list(" A, NOT B ,,C") == std::vector<std::string>{"A", "NOT B", "C"},
              "split_list trims and skips empties");
    ctx.check_eq(join(AtomSet{"b", "a"}, ", "), "a, b", "join");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer tests
    runner.run("lexer_symbolic_ops",         test_lexer_symbolic_ops);
    runner.run("lexer_word_keywords",        test_lexer_word_keywords);
    runner.run("lexer_errors",               test_lexer_errors);
    runner.run("lexer_peek",                 test_lexer_peek);

    // Parser tests
    runner.run("parse_precedence",           test_parse_precedence);
    runner.run("parse_print",                test_parse_print);
    runner.run("parse_round_trip",           test_parse_round_trip);
    runner.run("parse_errors",               test_parse_errors);
    runner.run("parse_depth_limits",         test_parse_depth_limits);
    runner.run("try_parse",                  test_try_parse);
    runner.run("factory_interning",          test_factory_interning);

    // Evaluation and truth tables
    runner.run("evaluate_literals",          test_evaluate_literals);
    runner.run("evaluate_connectives",       test_evaluate_connectives);
    runner.run("truth_table_rows",           test_truth_table_rows);
    runner.run("truth_table_options",        test_truth_table_options);
    runner.run("truth_table_render",         test_truth_table_render);

    // Rules
    runner.run("rules_load",                 test_rules_load);
    runner.run("rule_file",                  test_rule_file);
    runner.run("rule_file_special_text",     test_rule_file_special_text);

    // Forward chaining
    runner.run("forward_single_rule",        test_forward_single_rule);
    runner.run("forward_chain_fixpoint",     test_forward_chain_fixpoint);
    runner.run("forward_negated_conclusion", test_forward_negated_conclusion);
    runner.run("contradictions",             test_contradictions);

    // Backward chaining
    runner.run("backward_success",           test_backward_success);
    runner.run("backward_failure",           test_backward_failure);
    runner.run("backward_cycle",             test_backward_cycle);
    runner.run("backward_guard_strategies",  test_backward_guard_strategies);

    // Z3 cross-checks
    runner.run("z3_matches_truth_table",     test_z3_matches_truth_table);
    runner.run("z3_checker",                 test_z3_checker);

    runner.run("cli_args",                   test_cli_args);
    runner.run("utils",                      test_utils);

    return runner.summarise();
}

}  // namespace pdm
