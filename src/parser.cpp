// ============================================================================
// parser.cpp — Recursive-descent formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// This parser consumes tokens from a Lexer and builds an AST via
// FormulaFactory.  The recursive-descent structure mirrors the grammar
// directly:
//
//   parse()           calls parse_iff()  and then expects Eof.
//   parse_iff()       handles  <->       (left-associative).
//   parse_implies()   handles  ->        (left-associative).
//   parse_or()        handles  OR |      (left-associative).
//   parse_xor()       handles  XOR       (left-associative).
//   parse_and()       handles  AND &     (left-associative).
//   parse_unary()     handles  NOT ~     (prefix).
//   parse_primary()   handles  atoms and parenthesised formulas.
//
// Every binary level is the same loop, so they share parse_left_fold().
//
// ============================================================================

#include "pdm/parser.hpp"
#include "pdm/errors.hpp"

namespace pdm {

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(Lexer& lexer, FormulaFactory& factory)
    : lex_(lexer), fac_(factory) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw SyntaxError(msg, tok.pos);
}

Token Parser::expect(TokenKind kind) {
    Token t = lex_.next();
    if (t.kind != kind) {
        error(t, "expected " + std::string(token_kind_name(kind)) +
                 " but found " + token_kind_name(t.kind));
    }
    return t;
}

void Parser::enter(const Token& tok) {
    if (++nesting_ > kMaxNesting) {
        error(tok, "formula nested more than " + std::to_string(kMaxNesting) +
                   " levels deep");
    }
}

FormulaId Parser::depth_checked(FormulaId id, const Token& tok) {
    if (fac_.node(id).depth > kMaxFormulaDepth) {
        error(tok, "formula deeper than " + std::to_string(kMaxFormulaDepth) + " levels");
    }
    return id;
}

// ── parse ───────────────────────────────────────────────────────────────────
// Entry point: parse one formula then require end-of-input.

FormulaId Parser::parse() {
    FormulaId f = parse_iff();
    const Token& t = lex_.peek();
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token '" + t.text + "' after complete formula");
    }
    return f;
}

// ── parse_left_fold ─────────────────────────────────────────────────────────
// level ::= operand ( op operand )*
// a op b op c  =  (a op b) op c

FormulaId Parser::parse_left_fold(TokenKind op, NodeKind kind,
                                  FormulaId (Parser::*operand)()) {
    FormulaId lhs = (this->*operand)();
    while (lex_.peek().kind == op) {
        Token op_tok = lex_.next();
        FormulaId rhs = (this->*operand)();
        lhs = depth_checked(fac_.make_binary(kind, lhs, rhs), op_tok);
    }
    return lhs;
}

FormulaId Parser::parse_iff() {
    return parse_left_fold(TokenKind::Iff, NodeKind::Iff, &Parser::parse_implies);
}

FormulaId Parser::parse_implies() {
    return parse_left_fold(TokenKind::Implies, NodeKind::Implies, &Parser::parse_or);
}

FormulaId Parser::parse_or() {
    return parse_left_fold(TokenKind::Or, NodeKind::Or, &Parser::parse_xor);
}

FormulaId Parser::parse_xor() {
    return parse_left_fold(TokenKind::Xor, NodeKind::Xor, &Parser::parse_and);
}

FormulaId Parser::parse_and() {
    return parse_left_fold(TokenKind::And, NodeKind::And, &Parser::parse_unary);
}

// ── parse_unary ─────────────────────────────────────────────────────────────
// unary ::= NOT unary | primary
// Right-associative among themselves via the recursive call.

FormulaId Parser::parse_unary() {
    if (lex_.peek().kind == TokenKind::Not) {
        Token not_tok = lex_.next();
        enter(not_tok);
        FormulaId child = parse_unary();
        --nesting_;
        return depth_checked(fac_.make_not(child), not_tok);
    }
    return parse_primary();
}

// ── parse_primary ───────────────────────────────────────────────────────────

FormulaId Parser::parse_primary() {
    Token t = lex_.next();

    if (t.kind == TokenKind::Identifier) {
        return fac_.make_atom(t.text);
    }
    if (t.kind == TokenKind::LParen) {
        enter(t);
        FormulaId inner = parse_iff();
        expect(TokenKind::RParen);
        --nesting_;
        return inner;
    }
    error(t, "expected IDENT or ( but found " + std::string(token_kind_name(t.kind)));
}

// ── Free function convenience ───────────────────────────────────────────────

FormulaId parse_formula(std::string_view input, FormulaFactory& factory) {
    Lexer lex(input);
    Parser parser(lex, factory);
    return parser.parse();
}

std::optional<FormulaId> try_parse_formula(std::string_view input,
                                           FormulaFactory& factory,
                                           ParseError& err) {
    try {
        return parse_formula(input, factory);
    } catch (const SyntaxError& e) {
        err.message = e.what();
        err.position = e.position();
        return std::nullopt;
    }
}

}  // namespace pdm
