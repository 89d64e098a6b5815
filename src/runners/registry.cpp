#include "fcorr/registry.hpp"
#include "fcorr/runners.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace fcorr {

namespace {

constexpr double kConfidenceEpsilon = 1e-9;

std::string join_markers(const std::set<std::string>& markers) {
    std::string out;
    for (const auto& m : markers) {
        if (!out.empty()) out += ",";
        out += m;
    }
    return out;
}

} // namespace

RunnerRegistry RunnerRegistry::with_default_runners() {
    RunnerRegistry registry;
    registry.add(std::make_unique<NodeRunner>());
    registry.add(std::make_unique<PythonRunner>());
    registry.add(std::make_unique<GoRunner>());
    registry.add(std::make_unique<RustRunner>());
    return registry;
}

void RunnerRegistry::add(std::unique_ptr<EcosystemRunner> runner) {
    if (runner) runners_.push_back(std::move(runner));
}

const EcosystemRunner* RunnerRegistry::find(const std::string& name) const {
    for (const auto& r : runners_) {
        if (r->name() == name) return r.get();
    }
    return nullptr;
}

std::vector<EcosystemSignature> RunnerRegistry::detect_all(const CandidateProject& candidate) const {
    std::vector<EcosystemSignature> signatures;
    signatures.reserve(runners_.size());

    for (const auto& runner : runners_) {
        EcosystemSignature sig;
        try {
            sig = runner->detect(candidate);
        } catch (const std::exception& e) {
            spdlog::error("detector '{}' failed on {}: {}", runner->name(), candidate.root(), e.what());
            sig = EcosystemSignature{};
        }
        sig.name = runner->name();
        sig.confidence = std::min(1.0, std::max(0.0, sig.confidence));
        spdlog::debug("detect {}: {:.2f} [{}]", sig.name, sig.confidence, join_markers(sig.markers));
        signatures.push_back(std::move(sig));
    }
    return signatures;
}

DetectionOutcome RunnerRegistry::select(const CandidateProject& candidate, double min_confidence) const {
    DetectionOutcome outcome;
    outcome.signatures = detect_all(candidate);

    std::optional<size_t> best;
    for (size_t i = 0; i < outcome.signatures.size(); ++i) {
        const auto& sig = outcome.signatures[i];
        if (sig.confidence + kConfidenceEpsilon < min_confidence) continue;
        if (!best) {
            best = i;
            continue;
        }
        const auto& current = outcome.signatures[*best];
        if (sig.confidence > current.confidence + kConfidenceEpsilon) {
            best = i;
        } else if (std::fabs(sig.confidence - current.confidence) <= kConfidenceEpsilon &&
                   sig.markers.size() > current.markers.size()) {
            best = i;
        }
        // Equal confidence and marker count: earlier registration stays
    }

    if (best) {
        outcome.runner = runners_[*best].get();
        outcome.selected = outcome.signatures[*best];
    }
    return outcome;
}

} // namespace fcorr
