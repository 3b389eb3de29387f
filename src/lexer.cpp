// ============================================================================
// lexer.cpp — formula tokeniser implementation
// ============================================================================

#include "pdm/lexer.hpp"
#include "pdm/errors.hpp"

#include <algorithm>
#include <cctype>

namespace pdm {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier: return "IDENT";
        case TokenKind::And:        return "AND";
        case TokenKind::Or:         return "OR";
        case TokenKind::Not:        return "NOT";
        case TokenKind::Xor:        return "XOR";
        case TokenKind::Implies:    return "IMPLIES";
        case TokenKind::Iff:        return "IFF";
        case TokenKind::LParen:     return "(";
        case TokenKind::RParen:     return ")";
        case TokenKind::Eof:        return "EOF";
    }
    return "?";
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source)
    : src_(source) {}

Token Lexer::make_token(TokenKind kind, std::string text, std::size_t pos) {
    return Token{kind, std::move(text), pos};
}

void Lexer::error(const std::string& msg) const {
    throw SyntaxError(msg, idx_);
}

void Lexer::skip_whitespace() {
    while (idx_ < src_.size() &&
           std::isspace(static_cast<unsigned char>(src_[idx_]))) {
        ++idx_;
    }
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// ── read_identifier_or_keyword ──────────────────────────────────────────────
// Read [A-Za-z0-9_]+ and classify as keyword or identifier.  Keywords are
// matched case-insensitively; identifiers keep their spelling.

Token Lexer::read_identifier_or_keyword() {
    std::size_t begin = idx_;
    while (idx_ < src_.size() && is_ident_char(src_[idx_])) {
        ++idx_;
    }

    std::string text(src_.substr(begin, idx_ - begin));
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    TokenKind kind = TokenKind::Identifier;
    if (upper == "AND")      kind = TokenKind::And;
    else if (upper == "OR")  kind = TokenKind::Or;
    else if (upper == "NOT") kind = TokenKind::Not;
    else if (upper == "XOR") kind = TokenKind::Xor;

    return make_token(kind, std::move(text), begin);
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    skip_whitespace();

    if (idx_ >= src_.size()) {
        return make_token(TokenKind::Eof, "", idx_);
    }

    std::size_t start = idx_;
    char c = src_[idx_];

    // ── multi-character operators (longest first) ───────────────────────
    if (src_.substr(idx_, 3) == "<->") {
        idx_ += 3;
        return make_token(TokenKind::Iff, "<->", start);
    }
    if (src_.substr(idx_, 2) == "->") {
        idx_ += 2;
        return make_token(TokenKind::Implies, "->", start);
    }

    // ── single-character tokens ─────────────────────────────────────────
    if (c == '&') { ++idx_; return make_token(TokenKind::And,    "&", start); }
    if (c == '|') { ++idx_; return make_token(TokenKind::Or,     "|", start); }
    if (c == '~') { ++idx_; return make_token(TokenKind::Not,    "~", start); }
    if (c == '(') { ++idx_; return make_token(TokenKind::LParen, "(", start); }
    if (c == ')') { ++idx_; return make_token(TokenKind::RParen, ")", start); }

    // ── identifiers / keywords ──────────────────────────────────────────
    if (is_ident_char(c)) {
        return read_identifier_or_keyword();
    }

    error(std::string("unexpected character '") + c + "'");
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source) {
    Lexer lex(source);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace pdm
