#include <doctest/doctest.h>
#include <fcorr/runners.hpp>
#include <fcorr/verifier.hpp>

#include "test_helpers.hpp"

#include <cstdlib>

using namespace fcorr;

// These cases drive the real interpreter. They are skipped on hosts without
// python3 (or without pytest, where tests must actually run).

namespace {

bool have_python() {
    const char* path = std::getenv("PATH");
    return !find_executable("python3", path ? path : "").empty();
}

bool have_pytest() {
    if (!have_python()) return false;
    ProcessSpec spec;
    spec.argv = {"python3", "-c", "import pytest"};
    spec.timeout_ms = 30000;
    auto r = run_process(spec);
    return r.launched && r.exit_code == 0;
}

VerifierConfig python_config() {
    VerifierConfig config;
    config.timeout_ms = 120000;
    config.install_timeout_ms = 120000;
    return config;
}

// --no-index keeps pip offline so resolution fails fast
const char* kUnresolvable = "--no-index\nfcorr-unresolvable-package==99.99\n";

} // namespace

TEST_CASE("editable requirement reaches pip") {
    if (!have_python()) {
        MESSAGE("python3 not found, skipping");
        return;
    }
    fcorr::test::TempTestDir tmp;
    tmp.write("requirements.txt", "--no-index\n-e .\n");
    tmp.write("setup.py", "from setuptools import setup\n"
                          "setup(name='calc', version='0.1', py_modules=['calc'],\n"
                          "      install_requires=['fcorr-unresolvable-package==99.99'])\n");
    tmp.write("calc.py", "def add(a, b):\n    return a + b\n");
    tmp.write("test_calc.py", "from calc import add\n\ndef test_add():\n    assert add(1, 2) == 3\n");
    CandidateProject candidate(tmp.path());

    PythonRunner runner;
    RunContext ctx;
    ctx.install_timeout_ms = 120000;
    auto install = runner.install(candidate, runner.detect(candidate), ctx);

    CHECK(install.manifest_status == ManifestStatus::Declared);
    CHECK(install.packages_installed == 1);
    CHECK(install.output.find("$ ") != std::string::npos);
    CHECK_FALSE(install.success);
    CHECK(install.error_summary.has_value());
}

TEST_CASE("python candidate without manifest passes end to end") {
    if (!have_pytest()) {
        MESSAGE("python3 with pytest not found, skipping");
        return;
    }
    fcorr::test::TempTestDir tmp;
    tmp.write("calc.py", "def add(a, b):\n    return a + b\n");
    // Importing calc from tests/ relies on the candidate root being on PYTHONPATH
    tmp.write("tests/test_calc.py", "from calc import add\n\ndef test_add():\n    assert add(2, 3) == 5\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto report = Verifier(registry, python_config()).verify(tmp.path());

    CHECK(report.final_stage == Stage::Done);
    REQUIRE(report.ecosystem.has_value());
    CHECK(report.ecosystem->name == "python");
    REQUIRE(report.install.has_value());
    CHECK(report.install->manifest_status == ManifestStatus::NoneFound);
    REQUIRE(report.tests.has_value());
    CHECK(report.tests->total == 1);
    CHECK(report.tests->passed == 1);
    CHECK(report.score == doctest::Approx(100.0));
}

TEST_CASE("python candidate with a failing test scores zero under strict") {
    if (!have_pytest()) {
        MESSAGE("python3 with pytest not found, skipping");
        return;
    }
    fcorr::test::TempTestDir tmp;
    tmp.write("test_calc.py", "def test_add():\n    assert 1 + 1 == 2\n\n"
                              "def test_sub():\n    assert 3 - 1 == 3\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto report = Verifier(registry, python_config()).verify(tmp.path());

    CHECK(report.final_stage == Stage::Done);
    REQUIRE(report.tests.has_value());
    CHECK(report.tests->total == 2);
    CHECK(report.tests->failed == 1);
    REQUIRE(report.tests->failures.size() == 1);
    CHECK(report.tests->failures[0].test_name == "test_sub");
    CHECK(report.score == 0.0);
}

TEST_CASE("unresolvable requirement stops before execution") {
    if (!have_python()) {
        MESSAGE("python3 not found, skipping");
        return;
    }
    fcorr::test::TempTestDir tmp;
    tmp.write("requirements.txt", kUnresolvable);
    tmp.write("test_calc.py", "def test_add():\n    assert 1 + 1 == 2\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto report = Verifier(registry, python_config()).verify(tmp.path());

    CHECK(report.final_stage == Stage::Failed);
    CHECK(report.error_kind == ErrorKind::InstallFailure);
    REQUIRE(report.install.has_value());
    CHECK_FALSE(report.install->success);
    CHECK(report.install->manifest_status == ManifestStatus::Declared);
    CHECK_FALSE(report.tests.has_value());
    CHECK(report.score == 0.0);
}
