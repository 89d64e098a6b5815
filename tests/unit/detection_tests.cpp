#include <doctest/doctest.h>
#include <fcorr/registry.hpp>
#include <fcorr/runners.hpp>

#include "test_helpers.hpp"

#include <stdexcept>

using namespace fcorr;
using fcorr::test::TempTestDir;

namespace {

// Detector with a fixed answer; install/execute are never reached here
class FixedRunner : public EcosystemRunner {
public:
    FixedRunner(std::string name, double confidence, std::set<std::string> markers, bool throws = false)
        : name_(std::move(name)), confidence_(confidence), markers_(std::move(markers)), throws_(throws) {}

    std::string name() const override { return name_; }

    EcosystemSignature detect(const CandidateProject&) const override {
        if (throws_) throw std::runtime_error("detector exploded");
        EcosystemSignature sig;
        sig.name = name_;
        sig.confidence = confidence_;
        sig.markers = markers_;
        return sig;
    }

    InstallResult install(const CandidateProject&, const EcosystemSignature&, const RunContext&) const override {
        return {};
    }

    ExecutionOutput execute(const CandidateProject&, const EcosystemSignature&, const std::optional<std::string>&,
                            const RunContext&) const override {
        return {};
    }

private:
    std::string name_;
    double confidence_;
    std::set<std::string> markers_;
    bool throws_;
};

const EcosystemSignature& signature_named(const DetectionOutcome& outcome, const std::string& name) {
    for (const auto& sig : outcome.signatures) {
        if (sig.name == name) return sig;
    }
    throw std::runtime_error("no signature " + name);
}

} // namespace

TEST_CASE("default registry order") {
    auto registry = RunnerRegistry::with_default_runners();
    REQUIRE(registry.runners().size() == 4);
    CHECK(registry.runners()[0]->name() == "node");
    CHECK(registry.runners()[1]->name() == "python");
    CHECK(registry.runners()[2]->name() == "go");
    CHECK(registry.runners()[3]->name() == "rust");
    CHECK(registry.find("go") != nullptr);
    CHECK(registry.find("java") == nullptr);
}

TEST_CASE("python candidate") {
    TempTestDir tmp;
    tmp.write("requirements.txt", "requests==2.31.0\npytest\n");
    tmp.write("app.py", "def add(a, b):\n    return a + b\n");
    tmp.write("tests/test_app.py", "from app import add\n\ndef test_add():\n    assert add(1, 2) == 3\n");
    tmp.write("tests/conftest.py", "");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));

    REQUIRE(outcome.found());
    CHECK(outcome.runner->name() == "python");
    REQUIRE(outcome.selected.has_value());
    CHECK(outcome.selected->confidence == doctest::Approx(1.0));
    CHECK(outcome.selected->tool_family == ToolFamily::Pytest);
    CHECK(outcome.selected->manifest_kind == "requirements.txt");
    CHECK(outcome.selected->markers.count("test_files") == 1);
    CHECK(outcome.selected->markers.count("conftest.py") == 1);
    CHECK(outcome.selected->markers.count("pytest_declared") == 1);

    CHECK(outcome.signatures.size() == 4);
    CHECK(signature_named(outcome, "node").confidence == 0.0);
    CHECK(signature_named(outcome, "go").confidence == 0.0);
}

TEST_CASE("node candidate with jest") {
    TempTestDir tmp;
    tmp.write("package.json", R"({"name": "calc", "scripts": {"test": "jest"}, "devDependencies": {"jest": "^29.0.0"}})");
    tmp.write("src/calc.test.js", "test('adds', () => expect(1 + 1).toBe(2));\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.found());
    CHECK(outcome.runner->name() == "node");
    CHECK(outcome.selected->tool_family == ToolFamily::Jest);
    CHECK(outcome.selected->confidence == doctest::Approx(1.0));
}

TEST_CASE("node framework inferred from test imports") {
    TempTestDir tmp;
    tmp.write("package.json", R"({"name": "calc"})");
    tmp.write("tsconfig.json", "{}");
    tmp.write("src/calc.test.ts", "import { it, expect } from 'vitest';\nit('adds', () => expect(2).toBe(2));\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.found());
    CHECK(outcome.selected->tool_family == ToolFamily::Vitest);
    CHECK(outcome.selected->confidence == doctest::Approx(0.7));
}

TEST_CASE("node framework inferred from the test script") {
    TempTestDir tmp;
    tmp.write("package.json", R"({"scripts": {"test": "mocha --recursive"}})");
    tmp.write("test/calc.spec.js", "describe('calc', () => {});\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.found());
    CHECK(outcome.selected->tool_family == ToolFamily::Mocha);
}

TEST_CASE("node without package.json has no confidence") {
    TempTestDir tmp;
    tmp.write("src/calc.test.js", "");

    NodeRunner node;
    auto sig = node.detect(CandidateProject(tmp.path()));
    CHECK(sig.confidence == 0.0);
    CHECK(sig.markers.empty());
}

TEST_CASE("go candidate") {
    TempTestDir tmp;
    tmp.write("go.mod", "module example.com/calc\n\ngo 1.21\n");
    tmp.write("calc.go", "package calc\n");
    tmp.write("calc_test.go", "package calc\n\nimport \"testing\"\n\nfunc TestAdd(t *testing.T) {}\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.found());
    CHECK(outcome.runner->name() == "go");
    CHECK(outcome.selected->confidence == doctest::Approx(1.0));
    CHECK(outcome.selected->tool_family == ToolFamily::GoTest);
}

TEST_CASE("rust candidate") {
    TempTestDir tmp;
    tmp.write("Cargo.toml", "[package]\nname = \"calc\"\nversion = \"0.1.0\"\n");
    tmp.write("src/lib.rs", "#[cfg(test)]\nmod tests {\n    #[test]\n    fn adds() {}\n}\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.found());
    CHECK(outcome.runner->name() == "rust");
    CHECK(outcome.selected->confidence == doctest::Approx(0.8));
}

TEST_CASE("vendored test files never count") {
    TempTestDir tmp;
    tmp.write("venv/lib/python3.11/site-packages/six/test_six.py", "");
    tmp.write("node_modules/pkg/test_util.py", "");
    tmp.write(".venv/lib/test_x.py", "");
    tmp.write("README.md", "# nothing here\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(CandidateProject(tmp.path()));
    CHECK_FALSE(outcome.found());
    CHECK(signature_named(outcome, "python").confidence == 0.0);
    CHECK(outcome.signatures.size() == 4);
}

TEST_CASE("detection is idempotent") {
    TempTestDir tmp;
    tmp.write("pyproject.toml", "[project]\nname = \"calc\"\ndependencies = [\"pytest\"]\n");
    tmp.write("test_calc.py", "def test_ok():\n    pass\n");

    auto registry = RunnerRegistry::with_default_runners();
    auto first = registry.detect_all(CandidateProject(tmp.path()));
    auto second = registry.detect_all(CandidateProject(tmp.path()));
    CHECK(first == second);
}

TEST_CASE("selection threshold") {
    TempTestDir tmp;
    tmp.write("conftest.py", "");

    auto registry = RunnerRegistry::with_default_runners();
    CHECK_FALSE(registry.select(CandidateProject(tmp.path())).found());

    auto relaxed = registry.select(CandidateProject(tmp.path()), 0.1);
    REQUIRE(relaxed.found());
    CHECK(relaxed.runner->name() == "python");
}

TEST_CASE("ties prefer more markers, then registration order") {
    TempTestDir tmp;

    SUBCASE("more markers win") {
        RunnerRegistry registry;
        registry.add(std::make_unique<FixedRunner>("first", 0.6, std::set<std::string>{"a"}));
        registry.add(std::make_unique<FixedRunner>("second", 0.6, std::set<std::string>{"a", "b"}));
        auto outcome = registry.select(CandidateProject(tmp.path()));
        REQUIRE(outcome.found());
        CHECK(outcome.runner->name() == "second");
    }

    SUBCASE("equal markers keep registration order") {
        RunnerRegistry registry;
        registry.add(std::make_unique<FixedRunner>("first", 0.6, std::set<std::string>{"a"}));
        registry.add(std::make_unique<FixedRunner>("second", 0.6, std::set<std::string>{"b"}));
        auto outcome = registry.select(CandidateProject(tmp.path()));
        REQUIRE(outcome.found());
        CHECK(outcome.runner->name() == "first");
    }

    SUBCASE("higher confidence beats markers") {
        RunnerRegistry registry;
        registry.add(std::make_unique<FixedRunner>("first", 0.5, std::set<std::string>{"a", "b", "c"}));
        registry.add(std::make_unique<FixedRunner>("second", 0.9, std::set<std::string>{"a"}));
        auto outcome = registry.select(CandidateProject(tmp.path()));
        REQUIRE(outcome.found());
        CHECK(outcome.runner->name() == "second");
    }
}

TEST_CASE("a throwing detector yields zero confidence") {
    TempTestDir tmp;
    RunnerRegistry registry;
    registry.add(std::make_unique<FixedRunner>("broken", 0.9, std::set<std::string>{}, true));
    registry.add(std::make_unique<FixedRunner>("working", 0.5, std::set<std::string>{"x"}));

    auto outcome = registry.select(CandidateProject(tmp.path()));
    REQUIRE(outcome.signatures.size() == 2);
    CHECK(outcome.signatures[0].name == "broken");
    CHECK(outcome.signatures[0].confidence == 0.0);
    REQUIRE(outcome.found());
    CHECK(outcome.runner->name() == "working");
}
