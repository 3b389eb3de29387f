// ============================================================================
// pdm/errors.hpp — Exception types shared by the engine
// ============================================================================
//
//   SyntaxError    tokenising / parsing failures (user input)
//   RuleLoadError  malformed rule records or rule files (user input)
//   InternalError  a broken engine invariant (a defect, never user input)
//
// ============================================================================

#ifndef PDM_ERRORS_HPP
#define PDM_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pdm {

// ── SyntaxError ─────────────────────────────────────────────────────────────
// Thrown by the lexer and the parser.  The message already contains the
// position; position() exposes it for callers that highlight the input.

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& msg, std::size_t position)
        : std::runtime_error(msg + " at position " + std::to_string(position)),
          position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// ── RuleLoadError ───────────────────────────────────────────────────────────

class RuleLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── InternalError ───────────────────────────────────────────────────────────

class InternalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace pdm

#endif  // PDM_ERRORS_HPP
