// ============================================================================
// pdm/parser.hpp — Recursive-descent parser for propositional formulas
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   formula   ::= iff_expr
//   iff_expr  ::= impl_expr ( '<->' impl_expr )*              (left-assoc)
//   impl_expr ::= or_expr   ( '->'  or_expr )*                (left-assoc)
//   or_expr   ::= xor_expr  ( ('OR' | '|') xor_expr )*        (left-assoc)
//   xor_expr  ::= and_expr  ( 'XOR' and_expr )*               (left-assoc)
//   and_expr  ::= unary     ( ('AND' | '&') unary )*          (left-assoc)
//   unary     ::= ('NOT' | '~') unary | primary
//   primary   ::= IDENTIFIER | '(' formula ')'
//
// Precedence (highest → lowest):
//   1. NOT ~        (unary prefix)
//   2. AND &
//   3. XOR
//   4. OR |
//   5. ->
//   6. <->
//
// ============================================================================

#ifndef PDM_PARSER_HPP
#define PDM_PARSER_HPP

#include "pdm/ast.hpp"
#include "pdm/lexer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pdm {

// ── ParseError ──────────────────────────────────────────────────────────────
// Carries the formatted error string for display, for callers that use the
// non-throwing entry point.

struct ParseError {
    std::string message;   // already formatted with the position
    std::size_t position = 0;
};

// ── Parser ──────────────────────────────────────────────────────────────────
// Takes a Lexer and a FormulaFactory reference.  Parses exactly one formula
// and returns its FormulaId.  Throws SyntaxError on malformed input.

// Parenthesis/NOT nesting bounds the parser's recursion; tree depth bounds
// the recursion of every later pass over the formula.
inline constexpr std::size_t   kMaxNesting      = 1000;
inline constexpr std::uint32_t kMaxFormulaDepth = 10000;

class Parser {
public:
    Parser(Lexer& lexer, FormulaFactory& factory);

    /// Parse a complete formula (expects Eof after).
    FormulaId parse();

private:
    // ── Recursive-descent methods, one per precedence level ─────────────
    FormulaId parse_iff();
    FormulaId parse_implies();
    FormulaId parse_or();
    FormulaId parse_xor();
    FormulaId parse_and();
    FormulaId parse_unary();
    FormulaId parse_primary();

    // Shared left fold for all binary levels.
    FormulaId parse_left_fold(TokenKind op, NodeKind kind,
                              FormulaId (Parser::*operand)());

    // ── Helpers ─────────────────────────────────────────────────────────
    Token expect(TokenKind kind);
    [[noreturn]] void error(const Token& tok, const std::string& msg);
    void      enter(const Token& tok);
    FormulaId depth_checked(FormulaId id, const Token& tok);

    Lexer&          lex_;
    FormulaFactory& fac_;
    std::size_t     nesting_ = 0;
};

// ── Convenience free functions ──────────────────────────────────────────────

/// Parse a single formula from a string.  Throws SyntaxError.
FormulaId parse_formula(std::string_view input, FormulaFactory& factory);

/// Non-throwing variant: returns nullopt and fills `err` on a syntax error.
std::optional<FormulaId> try_parse_formula(std::string_view input,
                                           FormulaFactory& factory,
                                           ParseError& err);

}  // namespace pdm

#endif  // PDM_PARSER_HPP
