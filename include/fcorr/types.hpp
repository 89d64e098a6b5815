#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Tool Families
// ============================================================================

enum class ToolFamily {
    Unknown,
    Pytest,
    Jest,
    Vitest,
    Mocha,
    GoTest,
    CargoTest,
};

inline const char* tool_family_to_string(ToolFamily f) {
    switch (f) {
        case ToolFamily::Pytest: return "pytest";
        case ToolFamily::Jest: return "jest";
        case ToolFamily::Vitest: return "vitest";
        case ToolFamily::Mocha: return "mocha";
        case ToolFamily::GoTest: return "go_test";
        case ToolFamily::CargoTest: return "cargo_test";
        case ToolFamily::Unknown: return "unknown";
        default: return "unknown";
    }
}

// Parse tool family string (case-insensitive)
std::optional<ToolFamily> parse_tool_family(const std::string& s);

// ============================================================================
// Scoring Policy
// ============================================================================

enum class ScoringPolicy {
    Strict,    // 100 iff failed == 0 and total > 0
    PassRate,  // 100 * passed / total
};

inline const char* scoring_policy_to_string(ScoringPolicy p) {
    switch (p) {
        case ScoringPolicy::Strict: return "strict";
        case ScoringPolicy::PassRate: return "pass_rate";
        default: return "strict";
    }
}

// Accepts "strict", "pass_rate", "pass-rate", "passrate" (case-insensitive)
std::optional<ScoringPolicy> parse_scoring_policy(const std::string& s);

// ============================================================================
// Verification Stages
// ============================================================================

enum class Stage {
    Detecting,
    Installing,
    Building,
    Executing,
    Parsing,
    Scoring,
    Done,
    Failed,
};

inline const char* stage_to_string(Stage s) {
    switch (s) {
        case Stage::Detecting: return "detecting";
        case Stage::Installing: return "installing";
        case Stage::Building: return "building";
        case Stage::Executing: return "executing";
        case Stage::Parsing: return "parsing";
        case Stage::Scoring: return "scoring";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
        default: return "failed";
    }
}

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    InvalidCandidate,
    NoCompatibleRunner,
    InstallFailure,
    ExecutionError,
    ExecutionTimeout,
    ParseFailure,
    NoTestsFound,
    BuildFailure,
    Cancelled,
    InternalError,
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidCandidate: return "invalid_candidate";
        case ErrorKind::NoCompatibleRunner: return "no_compatible_runner";
        case ErrorKind::InstallFailure: return "install_failure";
        case ErrorKind::ExecutionError: return "execution_error";
        case ErrorKind::ExecutionTimeout: return "execution_timeout";
        case ErrorKind::ParseFailure: return "parse_failure";
        case ErrorKind::NoTestsFound: return "no_tests_found";
        case ErrorKind::BuildFailure: return "build_failure";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::InternalError: return "internal_error";
        default: return "internal_error";
    }
}

// ============================================================================
// Ecosystem Signature
// ============================================================================

struct EcosystemSignature {
    std::string name;                  // runner name, e.g. "python"
    double confidence = 0.0;           // [0, 1]
    std::set<std::string> markers;     // sorted, so detection is reproducible
    ToolFamily tool_family = ToolFamily::Unknown;
    std::string manifest_kind;         // e.g. "requirements.txt"; empty if none

    bool operator==(const EcosystemSignature& other) const {
        return name == other.name && confidence == other.confidence &&
               markers == other.markers && tool_family == other.tool_family &&
               manifest_kind == other.manifest_kind;
    }
    bool operator!=(const EcosystemSignature& other) const { return !(*this == other); }
};

// ============================================================================
// Install Result
// ============================================================================

enum class ManifestStatus {
    NoneFound,  // no dependency declaration file at all
    Empty,      // manifest present, declares nothing
    Declared,
};

inline const char* manifest_status_to_string(ManifestStatus s) {
    switch (s) {
        case ManifestStatus::NoneFound: return "none_found";
        case ManifestStatus::Empty: return "empty";
        case ManifestStatus::Declared: return "declared";
        default: return "none_found";
    }
}

struct InstallResult {
    bool success = false;
    long long duration_ms = 0;
    std::string output;                       // stdout + stderr of install commands
    int packages_installed = 0;
    std::optional<std::string> error_summary;
    ManifestStatus manifest_status = ManifestStatus::NoneFound;
    std::optional<std::string> manifest;      // manifest file that drove the install
    std::vector<std::string> warnings;
};

// Outcome of a project build run between install and test execution.
struct BuildResult {
    bool success = false;
    long long duration_ms = 0;
    std::vector<std::string> command;
    std::string output;                       // stdout + stderr of the build command
    std::vector<std::string> errors;          // compiler/bundler error lines
    std::vector<std::string> warnings;
    std::optional<std::string> error_summary;
};

// ============================================================================
// Test Results
// ============================================================================

struct TestFailure {
    std::string test_name;
    std::optional<std::string> file_path;
    std::optional<int> line_number;
    std::string error_message;
    std::optional<std::string> stack_trace;   // never truncated
};

enum class TestCondition {
    Completed,
    NoTestsFound,
    UnparsedOutput,
    BuildFailed,
    TimedOut,
    LaunchFailed,
};

inline const char* test_condition_to_string(TestCondition c) {
    switch (c) {
        case TestCondition::Completed: return "completed";
        case TestCondition::NoTestsFound: return "no_tests_found";
        case TestCondition::UnparsedOutput: return "unparsed_output";
        case TestCondition::BuildFailed: return "build_failed";
        case TestCondition::TimedOut: return "timed_out";
        case TestCondition::LaunchFailed: return "launch_failed";
        default: return "unparsed_output";
    }
}

struct TestResult {
    bool success = false;
    int total = 0;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    long long duration_ms = 0;
    std::string raw_output;
    std::vector<TestFailure> failures;        // tool-reported order
    int exit_code = -1;
    bool timed_out = false;
    TestCondition condition = TestCondition::UnparsedOutput;
    std::optional<std::string> error;

    double pass_rate() const {
        if (total <= 0) return 0.0;
        return 100.0 * static_cast<double>(passed) / static_cast<double>(total);
    }
};

// ============================================================================
// Verification Report
// ============================================================================

struct VerificationReport {
    std::string candidate;
    std::optional<EcosystemSignature> ecosystem;
    std::vector<EcosystemSignature> detections;   // every registered runner
    std::optional<InstallResult> install;
    std::optional<BuildResult> build;         // absent when nothing was built
    std::optional<TestResult> tests;
    double score = 0.0;
    ScoringPolicy scoring_mode = ScoringPolicy::Strict;
    Stage final_stage = Stage::Failed;
    ErrorKind error_kind = ErrorKind::None;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    long long duration_ms = 0;

    bool failed() const { return final_stage == Stage::Failed; }
};

} // namespace fcorr
