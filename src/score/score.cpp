#include "fcorr/score.hpp"

#include <algorithm>

namespace fcorr {

double compute_score(int total, int passed, int failed, ScoringPolicy policy) {
    if (total <= 0) return 0.0;

    switch (policy) {
        case ScoringPolicy::PassRate: {
            int clamped = std::max(0, std::min(passed, total));
            return 100.0 * static_cast<double>(clamped) / static_cast<double>(total);
        }
        case ScoringPolicy::Strict:
        default:
            return failed == 0 ? 100.0 : 0.0;
    }
}

} // namespace fcorr
