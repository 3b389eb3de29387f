// ============================================================================
// pdm/utils.hpp — Utility functions
// ============================================================================

#ifndef PDM_UTILS_HPP
#define PDM_UTILS_HPP

#include <string>
#include <vector>

namespace pdm {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split on `sep`, trimming each piece and dropping empty ones.
std::vector<std::string> split_list(const std::string& s, char sep = ',');

/// Join a range of strings with `sep`.
template <typename Range>
std::string join(const Range& items, const std::string& sep) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += sep;
        out += item;
        first = false;
    }
    return out;
}

}  // namespace pdm

#endif  // PDM_UTILS_HPP
