#include <doctest/doctest.h>
#include <fcorr/types.hpp>

#include <cstring>

using namespace fcorr;

TEST_CASE("parse_tool_family accepts every family name") {
    CHECK(parse_tool_family("pytest") == ToolFamily::Pytest);
    CHECK(parse_tool_family("Jest") == ToolFamily::Jest);
    CHECK(parse_tool_family("VITEST") == ToolFamily::Vitest);
    CHECK(parse_tool_family("mocha") == ToolFamily::Mocha);
    CHECK(parse_tool_family("go_test") == ToolFamily::GoTest);
    CHECK(parse_tool_family("cargo_test") == ToolFamily::CargoTest);
    CHECK_FALSE(parse_tool_family("junit").has_value());
    CHECK_FALSE(parse_tool_family("").has_value());
}

TEST_CASE("tool family names round-trip") {
    for (auto f : {ToolFamily::Pytest, ToolFamily::Jest, ToolFamily::Vitest, ToolFamily::Mocha,
                   ToolFamily::GoTest, ToolFamily::CargoTest}) {
        auto parsed = parse_tool_family(tool_family_to_string(f));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == f);
    }
}

TEST_CASE("parse_scoring_policy spellings") {
    CHECK(parse_scoring_policy("strict") == ScoringPolicy::Strict);
    CHECK(parse_scoring_policy("STRICT") == ScoringPolicy::Strict);
    CHECK(parse_scoring_policy("pass_rate") == ScoringPolicy::PassRate);
    CHECK(parse_scoring_policy("pass-rate") == ScoringPolicy::PassRate);
    CHECK(parse_scoring_policy("PassRate") == ScoringPolicy::PassRate);
    CHECK_FALSE(parse_scoring_policy("lenient").has_value());
}

TEST_CASE("enum names used in reports") {
    CHECK(std::strcmp(stage_to_string(Stage::Done), "done") == 0);
    CHECK(std::strcmp(stage_to_string(Stage::Building), "building") == 0);
    CHECK(std::strcmp(error_kind_to_string(ErrorKind::NoCompatibleRunner), "no_compatible_runner") == 0);
    CHECK(std::strcmp(error_kind_to_string(ErrorKind::ExecutionTimeout), "execution_timeout") == 0);
    CHECK(std::strcmp(manifest_status_to_string(ManifestStatus::NoneFound), "none_found") == 0);
    CHECK(std::strcmp(test_condition_to_string(TestCondition::BuildFailed), "build_failed") == 0);
}

TEST_CASE("TestResult pass rate") {
    TestResult r;
    CHECK(r.pass_rate() == doctest::Approx(0.0));

    r.total = 4;
    r.passed = 3;
    r.failed = 1;
    CHECK(r.pass_rate() == doctest::Approx(75.0));
}

TEST_CASE("default report is a failure with no error kind") {
    VerificationReport report;
    CHECK(report.failed());
    CHECK(report.score == 0.0);
    CHECK(report.error_kind == ErrorKind::None);
}

TEST_CASE("signature equality covers markers") {
    EcosystemSignature a;
    a.name = "python";
    a.confidence = 0.7;
    a.markers = {"manifest", "test_files"};
    EcosystemSignature b = a;
    CHECK(a == b);
    b.markers.insert("conftest.py");
    CHECK(a != b);
}
