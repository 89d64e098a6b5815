#pragma once

#include "fcorr/config.hpp"
#include "fcorr/process.hpp"
#include "fcorr/registry.hpp"
#include "fcorr/types.hpp"

#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Verification Orchestrator
// ============================================================================

/**
 * Drives one candidate through
 * Detecting -> Installing -> Executing -> Parsing -> Scoring -> Done,
 * with Failed reachable from every stage.
 *
 * verify() never throws: every outcome, including unexpected exceptions,
 * is captured in the returned report. A Verifier holds no per-run state and
 * may be shared by concurrent callers.
 */
class Verifier {
public:
    Verifier(const RunnerRegistry& registry, VerifierConfig config);

    VerificationReport verify(const std::string& candidate_path, const CancellationToken* cancel = nullptr) const;

    const VerifierConfig& config() const { return config_; }

private:
    void run_stages(VerificationReport& report, const CancellationToken* cancel) const;

    const RunnerRegistry& registry_;
    VerifierConfig config_;
};

/**
 * Verify many candidates on a fixed pool of worker threads.
 *
 * Reports come back in input order. One candidate's failure never affects
 * another; the token cancels the whole batch.
 */
std::vector<VerificationReport> verify_batch(const Verifier& verifier, const std::vector<std::string>& paths,
                                             int jobs, const CancellationToken* cancel = nullptr);

} // namespace fcorr
