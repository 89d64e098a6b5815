#include <doctest/doctest.h>
#include <fcorr/score.hpp>

using namespace fcorr;

TEST_CASE("strict scoring is all or nothing") {
    CHECK(compute_score(5, 5, 0, ScoringPolicy::Strict) == 100.0);
    CHECK(compute_score(5, 4, 1, ScoringPolicy::Strict) == 0.0);
    CHECK(compute_score(0, 0, 0, ScoringPolicy::Strict) == 0.0);
}

TEST_CASE("strict scoring ignores skipped tests") {
    // 3 passed, 2 skipped
    CHECK(compute_score(5, 3, 0, ScoringPolicy::Strict) == 100.0);
}

TEST_CASE("pass rate scoring") {
    CHECK(compute_score(4, 3, 1, ScoringPolicy::PassRate) == doctest::Approx(75.0));
    CHECK(compute_score(3, 1, 2, ScoringPolicy::PassRate) == doctest::Approx(33.3333).epsilon(0.001));
    CHECK(compute_score(0, 0, 0, ScoringPolicy::PassRate) == 0.0);
    CHECK(compute_score(10, 10, 0, ScoringPolicy::PassRate) == 100.0);
}

TEST_CASE("scores stay within bounds for every count combination") {
    for (int total = 0; total <= 6; ++total) {
        for (int passed = 0; passed <= total; ++passed) {
            for (int failed = 0; passed + failed <= total; ++failed) {
                for (auto policy : {ScoringPolicy::Strict, ScoringPolicy::PassRate}) {
                    double s = compute_score(total, passed, failed, policy);
                    CHECK(s >= 0.0);
                    CHECK(s <= 100.0);
                    if (total == 0) CHECK(s == 0.0);
                }
                double strict = compute_score(total, passed, failed, ScoringPolicy::Strict);
                CHECK((strict == 100.0) == (failed == 0 && total > 0));
            }
        }
    }
}

TEST_CASE("score from a test result") {
    TestResult r;
    r.total = 2;
    r.passed = 1;
    r.failed = 1;
    CHECK(compute_score(r, ScoringPolicy::PassRate) == doctest::Approx(50.0));
    CHECK(compute_score(r, ScoringPolicy::Strict) == 0.0);
}
