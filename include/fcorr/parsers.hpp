#pragma once

#include "fcorr/types.hpp"

#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Raw Tool Output
// ============================================================================

// Output of one test-tool invocation, tagged with the family that produced it.
struct RawOutput {
    ToolFamily family = ToolFamily::Unknown;
    std::string text;            // stdout followed by stderr
    int exit_code = -1;
    long long duration_ms = 0;
    bool timed_out = false;
};

/**
 * Convert raw tool output into a TestResult.
 *
 * Pure function: dispatches on RawOutput::family. An unknown family yields
 * an unparsed result. Never throws.
 */
TestResult parse_output(const RawOutput& raw);

// Error and warning lines pulled out of a build log.
struct BuildDiagnostics {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

namespace parsers {

// Each parser expects the family it is named after.
TestResult parse_pytest(const RawOutput& raw);
TestResult parse_jest(const RawOutput& raw);
TestResult parse_vitest(const RawOutput& raw);
TestResult parse_mocha(const RawOutput& raw);
TestResult parse_go_test(const RawOutput& raw);
TestResult parse_cargo_test(const RawOutput& raw);

// TypeScript diagnostics, "Error:"/"Warning:" lines and "Failed to compile." blocks
BuildDiagnostics parse_build_output(const std::string& text);

// Remove ANSI escape sequences and carriage returns
std::string strip_ansi(const std::string& text);

} // namespace parsers

} // namespace fcorr
