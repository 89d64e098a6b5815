#pragma once

#include "fcorr/runner.hpp"

#include <memory>
#include <vector>

namespace fcorr {

constexpr double kDefaultMinConfidence = 0.3;

// Result of running every detector against one candidate.
struct DetectionOutcome {
    std::vector<EcosystemSignature> signatures;  // registration order
    const EcosystemRunner* runner = nullptr;     // nullptr: no compatible runner
    std::optional<EcosystemSignature> selected;

    bool found() const { return runner != nullptr; }
};

/**
 * Closed set of ecosystem runners.
 *
 * Populated once, read-only afterwards; safe for concurrent detection.
 */
class RunnerRegistry {
public:
    RunnerRegistry() = default;

    // node, python, go, rust in that order
    static RunnerRegistry with_default_runners();

    void add(std::unique_ptr<EcosystemRunner> runner);

    const std::vector<std::unique_ptr<EcosystemRunner>>& runners() const { return runners_; }

    const EcosystemRunner* find(const std::string& name) const;

    // One signature per runner. A throwing detector yields zero confidence.
    std::vector<EcosystemSignature> detect_all(const CandidateProject& candidate) const;

    /**
     * Pick the runner for a candidate.
     *
     * Highest confidence at or above min_confidence wins; ties prefer more
     * markers, then registration order.
     */
    DetectionOutcome select(const CandidateProject& candidate, double min_confidence = kDefaultMinConfidence) const;

private:
    std::vector<std::unique_ptr<EcosystemRunner>> runners_;
};

} // namespace fcorr
