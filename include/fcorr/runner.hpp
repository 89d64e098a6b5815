#pragma once

#include "fcorr/candidate.hpp"
#include "fcorr/parsers.hpp"
#include "fcorr/process.hpp"
#include "fcorr/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Run Context
// ============================================================================

// Per-verification knobs handed to install() and execute().
struct RunContext {
    long long timeout_ms = 300000;
    long long install_timeout_ms = 600000;
    std::size_t max_output_bytes = 32u * 1024u * 1024u;
    bool isolate_python_env = true;
    bool expect_manifest = false;
    const CancellationToken* cancel = nullptr;
};

// What execute() observed: the process record and the tagged output for parsing.
struct ExecutionOutput {
    ProcessResult process;
    RawOutput raw;
    std::vector<std::string> command;
};

// ============================================================================
// Ecosystem Runner
// ============================================================================

/**
 * One supported ecosystem: detection, dependency install, test execution
 * and output parsing.
 *
 * Implementations are stateless; everything learned during detection
 * travels in the EcosystemSignature. Instances are shared by concurrent
 * verifications and must only be read.
 */
class EcosystemRunner {
public:
    virtual ~EcosystemRunner() = default;

    virtual std::string name() const = 0;

    // Read-only inspection. Confidence is additive per marker, capped at 1.0.
    virtual EcosystemSignature detect(const CandidateProject& candidate) const = 0;

    virtual InstallResult install(const CandidateProject& candidate, const EcosystemSignature& signature,
                                  const RunContext& ctx) const = 0;

    /**
     * Build the project after install, when it declares a build.
     * std::nullopt means there is nothing to build. Runs under the
     * install timeout.
     */
    virtual std::optional<BuildResult> build(const CandidateProject& candidate, const EcosystemSignature& signature,
                                             const RunContext& ctx) const {
        (void)candidate;
        (void)signature;
        (void)ctx;
        return std::nullopt;
    }

    // test_dir is relative to the candidate root
    virtual ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                                    const std::optional<std::string>& test_dir,
                                    const RunContext& ctx) const = 0;

    virtual TestResult parse(const RawOutput& raw) const { return parse_output(raw); }

    // File name patterns of this ecosystem's tests. A conventional tests/
    // directory is handed to execute() only when it holds a match.
    virtual std::vector<std::string> test_file_patterns() const { return {}; }
};

} // namespace fcorr
