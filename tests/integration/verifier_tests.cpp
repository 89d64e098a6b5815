#include <doctest/doctest.h>
#include <fcorr/verifier.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fcorr;

namespace {

// Claims candidates holding "scripted.txt" and replays out.txt as pytest output
class ScriptedRunner : public EcosystemRunner {
public:
    std::string script = "cat out.txt";
    std::vector<std::string> argv;           // overrides script when set
    bool install_ok = true;
    std::vector<std::string> install_warnings;
    bool throw_in_install = false;
    std::optional<std::string> build_script;  // shell command; unset means nothing to build
    mutable std::mutex mutex;
    mutable std::optional<std::string> seen_test_dir;
    mutable std::atomic<int> installs{0};
    mutable std::atomic<int> builds{0};

    std::string name() const override { return "scripted"; }

    std::vector<std::string> test_file_patterns() const override { return {"test_*.py"}; }

    EcosystemSignature detect(const CandidateProject& candidate) const override {
        EcosystemSignature sig;
        sig.name = name();
        sig.tool_family = ToolFamily::Pytest;
        if (candidate.has_file("scripted.txt")) {
            sig.confidence = 0.9;
            sig.markers.insert("scripted.txt");
        }
        return sig;
    }

    InstallResult install(const CandidateProject&, const EcosystemSignature&, const RunContext& ctx) const override {
        ++installs;
        if (throw_in_install) throw std::runtime_error("boom");
        InstallResult install;
        install.success = install_ok;
        install.manifest_status = ManifestStatus::NoneFound;
        install.warnings = install_warnings;
        if (!install_ok) install.error_summary = "pip exploded";
        if (ctx.expect_manifest) install.warnings.push_back("expected dependency manifest not found");
        return install;
    }

    std::optional<BuildResult> build(const CandidateProject& candidate, const EcosystemSignature&,
                                     const RunContext& ctx) const override {
        if (!build_script) return std::nullopt;
        ++builds;

        ProcessSpec spec;
        spec.argv = {"/bin/sh", "-c", *build_script};
        spec.cwd = candidate.root();
        spec.timeout_ms = ctx.install_timeout_ms;
        auto process = run_process(spec, ctx.cancel);

        BuildResult build;
        build.command = spec.argv;
        build.output = process.combined_output();
        build.success = process.launched && process.exit_code == 0;
        auto diag = parsers::parse_build_output(build.output);
        build.errors = diag.errors;
        build.warnings = diag.warnings;
        if (!build.success) {
            build.error_summary = build.errors.empty() ? "exit code " + std::to_string(process.exit_code)
                                                       : build.errors.front();
        }
        return build;
    }

    ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature&,
                            const std::optional<std::string>& test_dir, const RunContext& ctx) const override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen_test_dir = test_dir;
        }

        ProcessSpec spec;
        spec.argv = argv.empty() ? std::vector<std::string>{"/bin/sh", "-c", script} : argv;
        spec.cwd = candidate.root();
        spec.timeout_ms = ctx.timeout_ms;
        spec.max_output_bytes = ctx.max_output_bytes;

        ExecutionOutput out;
        out.command = spec.argv;
        out.process = run_process(spec, ctx.cancel);
        out.raw.family = ToolFamily::Pytest;
        out.raw.text = out.process.combined_output();
        out.raw.exit_code = out.process.exit_code;
        out.raw.duration_ms = out.process.duration_ms;
        out.raw.timed_out = out.process.timed_out;
        return out;
    }
};

const char* kAllPass = "tests/test_calc.py::test_add PASSED\n"
                       "tests/test_calc.py::test_mul PASSED\n"
                       "============================== 2 passed in 0.01s ===============================\n";

const char* kOneFails = "tests/test_calc.py::test_add PASSED\n"
                        "tests/test_calc.py::test_sub FAILED\n"
                        "tests/test_calc.py::test_mul PASSED\n"
                        "=========================== short test summary info ============================\n"
                        "FAILED tests/test_calc.py::test_sub - assert 2 == 3\n"
                        "========================= 1 failed, 2 passed in 0.05s ==========================\n";

struct Fixture {
    fcorr::test::TempTestDir dir;
    RunnerRegistry registry;
    ScriptedRunner* runner = nullptr;

    Fixture() {
        auto owned = std::make_unique<ScriptedRunner>();
        runner = owned.get();
        registry.add(std::move(owned));
    }

    void candidate(const std::string& output) const {
        dir.write("scripted.txt", "");
        dir.write("out.txt", output);
    }
};

} // namespace

TEST_CASE("all tests passing scores 100") {
    Fixture fx;
    fx.candidate(kAllPass);
    Verifier verifier(fx.registry, VerifierConfig{});

    auto report = verifier.verify(fx.dir.path());
    CHECK(report.final_stage == Stage::Done);
    CHECK(report.error_kind == ErrorKind::None);
    CHECK_FALSE(report.error.has_value());
    CHECK(report.score == doctest::Approx(100.0));
    CHECK(report.scoring_mode == ScoringPolicy::Strict);
    REQUIRE(report.ecosystem.has_value());
    CHECK(report.ecosystem->name == "scripted");
    CHECK(report.detections.size() == 1);
    REQUIRE(report.install.has_value());
    CHECK(report.install->success);
    REQUIRE(report.tests.has_value());
    CHECK(report.tests->total == 2);
    CHECK(report.tests->passed == 2);
    CHECK(report.tests->success);
}

TEST_CASE("a single failure under each policy") {
    Fixture fx;
    fx.candidate(kOneFails);
    VerifierConfig config;

    SUBCASE("strict") {
        config.scoring_policy = ScoringPolicy::Strict;
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK(report.score == doctest::Approx(0.0));
        REQUIRE(report.tests.has_value());
        CHECK(report.tests->failed == 1);
        REQUIRE(report.tests->failures.size() == 1);
        CHECK(report.tests->failures[0].test_name == "test_sub");
    }

    SUBCASE("pass rate") {
        config.scoring_policy = ScoringPolicy::PassRate;
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK(report.scoring_mode == ScoringPolicy::PassRate);
        CHECK(report.score == doctest::Approx(200.0 / 3.0));
    }
}

TEST_CASE("timeouts fail with partial output") {
    Fixture fx;
    fx.candidate("");
    fx.runner->script = "echo 'tests/test_calc.py::test_add PASSED'; sleep 30";
    VerifierConfig config;
    config.timeout_ms = 300;

    auto report = Verifier(fx.registry, config).verify(fx.dir.path());
    CHECK(report.final_stage == Stage::Failed);
    CHECK(report.error_kind == ErrorKind::ExecutionTimeout);
    CHECK(report.score == 0.0);
    REQUIRE(report.tests.has_value());
    CHECK(report.tests->timed_out);
    CHECK(report.tests->condition == TestCondition::TimedOut);
    CHECK(report.tests->raw_output.find("test_add PASSED") != std::string::npos);
}

TEST_CASE("detection failures") {
    Fixture fx;
    Verifier verifier(fx.registry, VerifierConfig{});

    SUBCASE("no compatible runner") {
        fx.dir.write("README.md", "nothing to see\n");
        auto report = verifier.verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::NoCompatibleRunner);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "no compatible runner (best match scripted at 0.00)");
        CHECK(report.detections.size() == 1);
        CHECK_FALSE(report.ecosystem.has_value());
        CHECK(fx.runner->installs == 0);
    }

    SUBCASE("candidate is not a directory") {
        auto report = verifier.verify(fx.dir.path_of("missing"));
        CHECK(report.final_stage == Stage::Failed);
        CHECK(report.error_kind == ErrorKind::InvalidCandidate);
        CHECK(report.detections.empty());
    }

    SUBCASE("configured test directory missing") {
        fx.candidate(kAllPass);
        VerifierConfig config;
        config.test_dir = "spec";
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::InvalidCandidate);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "test directory not found: spec");
    }
}

TEST_CASE("test directory resolution") {
    Fixture fx;
    fx.candidate(kAllPass);

    SUBCASE("tests/ is used when it holds tests") {
        fx.dir.write("tests/test_calc.py", "def test_add():\n    pass\n");
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        REQUIRE(fx.runner->seen_test_dir.has_value());
        CHECK(*fx.runner->seen_test_dir == "tests");
    }

    SUBCASE("tests/ with fixtures only is not used") {
        fx.dir.write("tests/input.json", "{}");
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK_FALSE(fx.runner->seen_test_dir.has_value());
    }

    SUBCASE("root when there is no tests/") {
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK_FALSE(fx.runner->seen_test_dir.has_value());
    }

    SUBCASE("configured directory") {
        fx.dir.mkdir("spec");
        VerifierConfig config;
        config.test_dir = "spec";
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        REQUIRE(fx.runner->seen_test_dir.has_value());
        CHECK(*fx.runner->seen_test_dir == "spec");
    }
}

TEST_CASE("install stage") {
    Fixture fx;
    fx.candidate(kAllPass);

    SUBCASE("failure stops the run") {
        fx.runner->install_ok = false;
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::InstallFailure);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "dependency installation failed: pip exploded");
        REQUIRE(report.install.has_value());
        CHECK_FALSE(report.tests.has_value());
    }

    SUBCASE("disabled install is skipped") {
        fx.runner->install_ok = false;
        VerifierConfig config;
        config.auto_install = false;
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK_FALSE(report.install.has_value());
        CHECK(fx.runner->installs == 0);
    }

    SUBCASE("warnings reach the report") {
        VerifierConfig config;
        config.expect_manifest = true;
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        REQUIRE(report.warnings.size() == 1);
        CHECK(report.warnings[0] == "expected dependency manifest not found");
    }
}

TEST_CASE("build stage") {
    Fixture fx;
    fx.candidate(kAllPass);

    SUBCASE("nothing to build leaves no record") {
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK_FALSE(report.build.has_value());
    }

    SUBCASE("successful build keeps going") {
        fx.runner->build_script = "echo 'Warning: large bundle'";
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK(report.score == 100.0);
        REQUIRE(report.build.has_value());
        CHECK(report.build->success);
        REQUIRE(report.build->warnings.size() == 1);
        CHECK(report.build->warnings[0] == "large bundle");
    }

    SUBCASE("failure stops before tests") {
        fx.runner->build_script = "echo \"src/app.ts(3,7): error TS2322: Type 'string' is not assignable\"; exit 2";
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Failed);
        CHECK(report.error_kind == ErrorKind::BuildFailure);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "build failed: Type 'string' is not assignable");
        REQUIRE(report.build.has_value());
        CHECK_FALSE(report.build->success);
        CHECK_FALSE(report.tests.has_value());
        CHECK(report.score == 0.0);
    }

    SUBCASE("disabled build is skipped") {
        fx.runner->build_script = "exit 1";
        VerifierConfig config;
        config.run_build = false;
        auto report = Verifier(fx.registry, config).verify(fx.dir.path());
        CHECK(report.final_stage == Stage::Done);
        CHECK_FALSE(report.build.has_value());
        CHECK(fx.runner->builds == 0);
    }

    SUBCASE("failed install never builds") {
        fx.runner->install_ok = false;
        fx.runner->build_script = "true";
        auto report = Verifier(fx.registry, VerifierConfig{}).verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::InstallFailure);
        CHECK(fx.runner->builds == 0);
    }
}

TEST_CASE("execution and parse failures") {
    Fixture fx;
    Verifier verifier(fx.registry, VerifierConfig{});

    SUBCASE("launch failure") {
        fx.candidate(kAllPass);
        fx.runner->argv = {"fcorr-definitely-not-a-command"};
        auto report = verifier.verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::ExecutionError);
        REQUIRE(report.tests.has_value());
        CHECK(report.tests->condition == TestCondition::LaunchFailed);
    }

    SUBCASE("unrecognizable output") {
        fx.candidate("Segmentation fault\n");
        auto report = verifier.verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::ParseFailure);
        REQUIRE(report.tests.has_value());
        CHECK(report.tests->condition == TestCondition::UnparsedOutput);
        CHECK(report.tests->raw_output == "Segmentation fault\n");
    }

    SUBCASE("no tests collected") {
        fx.candidate("============================ no tests ran in 0.01s =============================\n");
        fx.runner->script = "cat out.txt; exit 5";
        auto report = verifier.verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::NoTestsFound);
        CHECK(report.score == 0.0);
    }

    SUBCASE("runner exceptions become internal errors") {
        fx.candidate(kAllPass);
        fx.runner->throw_in_install = true;
        auto report = verifier.verify(fx.dir.path());
        CHECK(report.error_kind == ErrorKind::InternalError);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "internal error: boom");
    }
}

TEST_CASE("cancellation discards partial results") {
    Fixture fx;
    fx.candidate(kAllPass);
    Verifier verifier(fx.registry, VerifierConfig{});

    SUBCASE("before start") {
        CancellationToken token;
        token.cancel();
        auto report = verifier.verify(fx.dir.path(), &token);
        CHECK(report.error_kind == ErrorKind::Cancelled);
        CHECK(report.detections.empty());
        CHECK(fx.runner->installs == 0);
    }

    SUBCASE("while tests run") {
        fx.runner->script = "sleep 30";
        CancellationToken token;
        std::thread canceller([&token] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            token.cancel();
        });
        auto report = verifier.verify(fx.dir.path(), &token);
        canceller.join();

        CHECK(report.final_stage == Stage::Failed);
        CHECK(report.error_kind == ErrorKind::Cancelled);
        REQUIRE(report.error.has_value());
        CHECK(*report.error == "verification cancelled");
        CHECK_FALSE(report.ecosystem.has_value());
        CHECK_FALSE(report.install.has_value());
        CHECK_FALSE(report.tests.has_value());
        CHECK(report.detections.empty());
    }
}

TEST_CASE("batch keeps input order") {
    fcorr::test::TempTestDir root;
    root.write("pass/scripted.txt", "");
    root.write("pass/out.txt", kAllPass);
    root.write("fail/scripted.txt", "");
    root.write("fail/out.txt", kOneFails);

    RunnerRegistry registry;
    registry.add(std::make_unique<ScriptedRunner>());
    Verifier verifier(registry, VerifierConfig{});

    std::vector<std::string> paths = {root.path_of("fail"), root.path_of("missing"), root.path_of("pass")};
    auto reports = verify_batch(verifier, paths, 3);

    REQUIRE(reports.size() == 3);
    CHECK(reports[0].candidate == paths[0]);
    CHECK(reports[0].final_stage == Stage::Done);
    CHECK(reports[0].score == 0.0);
    CHECK(reports[1].candidate == paths[1]);
    CHECK(reports[1].error_kind == ErrorKind::InvalidCandidate);
    CHECK(reports[2].candidate == paths[2]);
    CHECK(reports[2].score == doctest::Approx(100.0));

    CHECK(verify_batch(verifier, {}, 4).empty());
}
