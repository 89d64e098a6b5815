#include "fcorr/verifier.hpp"
#include "fcorr/candidate.hpp"
#include "fcorr/score.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>

namespace fcorr {

namespace {

constexpr const char* kDefaultTestDir = "tests";

// Thrown inside run_stages to unwind to verify(); never leaves this file
struct Cancelled {};

void check_cancel(const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) throw Cancelled{};
}

void enter(const VerificationReport& report, Stage stage) {
    spdlog::info("{}: {}", report.candidate, stage_to_string(stage));
}

void fail(VerificationReport& report, ErrorKind kind, const std::string& reason) {
    report.final_stage = Stage::Failed;
    report.error_kind = kind;
    report.error = reason;
    report.score = 0.0;
    spdlog::warn("{}: failed ({}): {}", report.candidate, error_kind_to_string(kind), reason);
}

// True when any file under dir has a name matching one of the patterns
bool holds_tests(const CandidateProject& candidate, const std::string& dir,
                 const std::vector<std::string>& patterns) {
    for (const auto& file : candidate.files_under(dir)) {
        auto slash = file.rfind('/');
        std::string name = slash == std::string::npos ? file : file.substr(slash + 1);
        for (const auto& pattern : patterns) {
            if (glob_match(pattern, name)) return true;
        }
    }
    return false;
}

std::string describe_best(const std::vector<EcosystemSignature>& signatures) {
    const EcosystemSignature* best = nullptr;
    for (const auto& sig : signatures) {
        if (!best || sig.confidence > best->confidence) best = &sig;
    }
    if (!best) return "no runners registered";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", best->confidence);
    return "best match " + best->name + " at " + buf;
}

} // namespace

Verifier::Verifier(const RunnerRegistry& registry, VerifierConfig config)
    : registry_(registry), config_(std::move(config)) {}

VerificationReport Verifier::verify(const std::string& candidate_path, const CancellationToken* cancel) const {
    auto started = std::chrono::steady_clock::now();

    VerificationReport report;
    report.candidate = candidate_path;
    report.scoring_mode = config_.scoring_policy;

    bool cancelled = false;
    try {
        run_stages(report, cancel);
    } catch (const Cancelled&) {
        cancelled = true;
    } catch (const std::exception& e) {
        fail(report, ErrorKind::InternalError, std::string("internal error: ") + e.what());
    } catch (...) {
        fail(report, ErrorKind::InternalError, "internal error: unknown exception");
    }

    if (cancelled) {
        // Partial stage results are discarded
        report = VerificationReport{};
        report.candidate = candidate_path;
        report.scoring_mode = config_.scoring_policy;
        report.final_stage = Stage::Failed;
        report.error_kind = ErrorKind::Cancelled;
        report.error = "verification cancelled";
        spdlog::info("{}: cancelled", candidate_path);
    }

    report.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return report;
}

void Verifier::run_stages(VerificationReport& report, const CancellationToken* cancel) const {
    check_cancel(cancel);

    // ------------------------------------------------------------------------
    // Detecting
    // ------------------------------------------------------------------------
    enter(report, Stage::Detecting);
    CandidateProject candidate(report.candidate);
    if (!candidate.valid()) {
        fail(report, ErrorKind::InvalidCandidate, "candidate is not a directory: " + report.candidate);
        return;
    }

    std::optional<std::string> test_dir;
    if (config_.test_dir) {
        if (!candidate.has_directory(*config_.test_dir)) {
            fail(report, ErrorKind::InvalidCandidate, "test directory not found: " + *config_.test_dir);
            return;
        }
        test_dir = config_.test_dir;
    }

    auto outcome = registry_.select(candidate, config_.min_confidence);
    report.detections = outcome.signatures;
    if (!outcome.found()) {
        fail(report, ErrorKind::NoCompatibleRunner, "no compatible runner (" + describe_best(outcome.signatures) + ")");
        return;
    }
    report.ecosystem = outcome.selected;
    const EcosystemRunner& runner = *outcome.runner;
    spdlog::info("{}: selected {} ({})", report.candidate, runner.name(),
                 tool_family_to_string(outcome.selected->tool_family));

    if (!test_dir && candidate.has_directory(kDefaultTestDir)) {
        if (holds_tests(candidate, kDefaultTestDir, runner.test_file_patterns())) {
            test_dir = kDefaultTestDir;
        } else {
            spdlog::debug("{}: {}/ holds no {} tests, running from the root", report.candidate, kDefaultTestDir,
                          runner.name());
        }
    }
    check_cancel(cancel);

    RunContext ctx;
    ctx.timeout_ms = config_.timeout_ms;
    ctx.install_timeout_ms = config_.install_timeout_ms;
    ctx.max_output_bytes = config_.max_output_bytes;
    ctx.isolate_python_env = config_.isolate_python_env;
    ctx.expect_manifest = config_.expect_manifest;
    ctx.cancel = cancel;

    // ------------------------------------------------------------------------
    // Installing
    // ------------------------------------------------------------------------
    if (config_.auto_install) {
        enter(report, Stage::Installing);
        InstallResult install = runner.install(candidate, *outcome.selected, ctx);
        check_cancel(cancel);
        report.warnings.insert(report.warnings.end(), install.warnings.begin(), install.warnings.end());
        report.install = install;
        if (!install.success) {
            fail(report, ErrorKind::InstallFailure,
                 "dependency installation failed: " + install.error_summary.value_or("unknown error"));
            return;
        }
    }

    // ------------------------------------------------------------------------
    // Building
    // ------------------------------------------------------------------------
    if (config_.run_build) {
        enter(report, Stage::Building);
        std::optional<BuildResult> build = runner.build(candidate, *outcome.selected, ctx);
        check_cancel(cancel);
        if (!build) {
            spdlog::debug("{}: nothing to build", report.candidate);
        } else {
            report.build = build;
            if (!build->success) {
                fail(report, ErrorKind::BuildFailure,
                     "build failed: " + build->error_summary.value_or("unknown error"));
                return;
            }
        }
    }

    // ------------------------------------------------------------------------
    // Executing
    // ------------------------------------------------------------------------
    enter(report, Stage::Executing);
    ExecutionOutput exec = runner.execute(candidate, *outcome.selected, test_dir, ctx);
    check_cancel(cancel);
    if (exec.process.cancelled) throw Cancelled{};
    if (!exec.process.launched) {
        TestResult launch;
        launch.condition = TestCondition::LaunchFailed;
        launch.error = exec.process.error;
        launch.duration_ms = exec.process.duration_ms;
        report.tests = launch;
        fail(report, ErrorKind::ExecutionError, "failed to launch test command: " + exec.process.error);
        return;
    }
    if (exec.process.output_truncated) {
        report.warnings.push_back("test output truncated at " + std::to_string(config_.max_output_bytes) +
                                  " bytes per stream");
    }

    // ------------------------------------------------------------------------
    // Parsing
    // ------------------------------------------------------------------------
    enter(report, Stage::Parsing);
    TestResult tests = runner.parse(exec.raw);
    report.tests = tests;

    if (tests.timed_out) {
        fail(report, ErrorKind::ExecutionTimeout, tests.error.value_or("test execution timed out"));
        return;
    }
    switch (tests.condition) {
        case TestCondition::Completed:
            break;
        case TestCondition::NoTestsFound:
            fail(report, ErrorKind::NoTestsFound, tests.error.value_or("no tests found"));
            return;
        case TestCondition::BuildFailed:
            fail(report, ErrorKind::BuildFailure, tests.error.value_or("build failed"));
            return;
        case TestCondition::LaunchFailed:
            fail(report, ErrorKind::ExecutionError, tests.error.value_or("test command failed to launch"));
            return;
        case TestCondition::TimedOut:
            fail(report, ErrorKind::ExecutionTimeout, tests.error.value_or("test execution timed out"));
            return;
        case TestCondition::UnparsedOutput:
        default:
            fail(report, ErrorKind::ParseFailure, tests.error.value_or("no recognizable test summary in output"));
            return;
    }

    // ------------------------------------------------------------------------
    // Scoring
    // ------------------------------------------------------------------------
    enter(report, Stage::Scoring);
    report.score = compute_score(tests, config_.scoring_policy);
    report.final_stage = Stage::Done;
    report.error_kind = ErrorKind::None;
    spdlog::info("{}: done, {}/{} passed, score {:.1f}", report.candidate, tests.passed, tests.total, report.score);
}

} // namespace fcorr
