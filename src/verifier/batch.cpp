#include "fcorr/verifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <thread>

namespace fcorr {

std::vector<VerificationReport> verify_batch(const Verifier& verifier, const std::vector<std::string>& paths,
                                             int jobs, const CancellationToken* cancel) {
    std::vector<VerificationReport> reports(paths.size());
    if (paths.empty()) return reports;

    size_t workers = static_cast<size_t>(std::max(1, jobs));
    workers = std::min(workers, paths.size());
    spdlog::debug("verifying {} candidate(s) with {} worker(s)", paths.size(), workers);

    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (size_t i = next++; i < paths.size(); i = next++) {
            // Each slot is written by exactly one worker
            reports[i] = verifier.verify(paths[i], cancel);
        }
    };

    if (workers == 1) {
        work();
        return reports;
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back(work);
    }
    for (auto& t : pool) {
        t.join();
    }
    return reports;
}

} // namespace fcorr
