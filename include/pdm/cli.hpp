// ============================================================================
// pdm/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: load rules → read formulas → tabulate / evaluate / check, then
// run forward and backward chaining on request.
//
// ============================================================================

#ifndef PDM_CLI_HPP
#define PDM_CLI_HPP

#include "pdm/backward.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pdm {

/// Largest atom count the driver will tabulate (2^16 rows).
inline constexpr std::size_t kMaxTableAtoms = 16;

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string input;          // formula or .txt file with one formula per line
    std::string rules_path;     // rule file (empty = no rules)
    std::string domain;         // empty = first domain in the rule file
    std::vector<std::string> facts;
    std::string goal;           // --prove
    CycleGuard  cycle_guard = CycleGuard::PerPath;

    bool selftest   = false;
    bool forward    = false;
    bool eval       = false;    // evaluate under --facts instead of tabulating
    bool all        = false;    // one table over every input formula
    bool true_rows  = false;
    bool csv        = false;
    bool check      = false;    // z3 satisfiability report
    bool list       = false;
    bool dot        = false;
    bool show_stats = false;
    bool verbose    = false;
    bool help       = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors).
int run(const Options& opts);

}  // namespace pdm

#endif  // PDM_CLI_HPP
