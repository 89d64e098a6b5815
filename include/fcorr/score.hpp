#pragma once

#include "fcorr/types.hpp"

namespace fcorr {

/**
 * Correctness score in [0, 100].
 *
 * Strict: 100 iff failed == 0 and total > 0, else 0.
 * PassRate: 100 * passed / total, 0 when total == 0.
 */
double compute_score(int total, int passed, int failed, ScoringPolicy policy);

inline double compute_score(const TestResult& result, ScoringPolicy policy) {
    return compute_score(result.total, result.passed, result.failed, policy);
}

} // namespace fcorr
