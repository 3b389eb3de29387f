// ============================================================================
// pdm/lexer.hpp — Tokeniser for the formula language
// ============================================================================
//
// The lexer converts a raw formula string into a stream of tokens.  Every
// token carries its 0-based character offset so that error messages can
// point the user to the exact location of a problem.
//
// Recognised tokens:
//   Identifiers  [A-Za-z0-9_]+      (AND, OR, NOT, XOR matched as keywords,
//                                    case-insensitively)
//   Symbols      ~  &  |  (  )  ->  <->
//   EOF          end-of-input sentinel
//
// Whitespace is skipped.  Any other character is a SyntaxError.
//
// ============================================================================

#ifndef PDM_LEXER_HPP
#define PDM_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pdm {

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    Identifier,     // atom name
    And,            // AND  &
    Or,             // OR   |
    Not,            // NOT  ~
    Xor,            // XOR
    Implies,        // ->
    Iff,            // <->
    LParen,         // (
    RParen,         // )
    Eof
};

/// Human-readable name for error messages.
const char* token_kind_name(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;       // original spelling, case preserved
    std::size_t pos  = 0;   // 0-based offset into the source
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Stores the full input and lazily produces tokens via next().
// Errors are reported by throwing SyntaxError.

class Lexer {
public:
    explicit Lexer(std::string_view source);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

private:
    void skip_whitespace();
    Token read_identifier_or_keyword();
    Token make_token(TokenKind kind, std::string text, std::size_t pos);

    [[noreturn]] void error(const std::string& msg) const;

    std::string_view src_;
    std::size_t      idx_ = 0;
    bool             has_peeked_ = false;
    Token            peeked_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source);

}  // namespace pdm

#endif  // PDM_LEXER_HPP
