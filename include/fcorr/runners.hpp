#pragma once

#include "fcorr/runner.hpp"

#include <string>

namespace fcorr {

// ============================================================================
// Registered Runners
// ============================================================================

// Node.js projects tested with jest, vitest or mocha.
class NodeRunner : public EcosystemRunner {
public:
    std::string name() const override { return "node"; }
    EcosystemSignature detect(const CandidateProject& candidate) const override;
    InstallResult install(const CandidateProject& candidate, const EcosystemSignature& signature,
                          const RunContext& ctx) const override;
    // Runs the "build" script, or "compile" when there is no "build"
    std::optional<BuildResult> build(const CandidateProject& candidate, const EcosystemSignature& signature,
                                     const RunContext& ctx) const override;
    ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                            const std::optional<std::string>& test_dir, const RunContext& ctx) const override;
    std::vector<std::string> test_file_patterns() const override;
};

// Python projects tested with pytest.
class PythonRunner : public EcosystemRunner {
public:
    static constexpr const char* kVenvDir = ".fcorr-venv";

    std::string name() const override { return "python"; }
    EcosystemSignature detect(const CandidateProject& candidate) const override;
    InstallResult install(const CandidateProject& candidate, const EcosystemSignature& signature,
                          const RunContext& ctx) const override;
    ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                            const std::optional<std::string>& test_dir, const RunContext& ctx) const override;
    std::vector<std::string> test_file_patterns() const override;
};

// Go modules tested with `go test`.
class GoRunner : public EcosystemRunner {
public:
    std::string name() const override { return "go"; }
    EcosystemSignature detect(const CandidateProject& candidate) const override;
    InstallResult install(const CandidateProject& candidate, const EcosystemSignature& signature,
                          const RunContext& ctx) const override;
    ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                            const std::optional<std::string>& test_dir, const RunContext& ctx) const override;
    std::vector<std::string> test_file_patterns() const override;
};

// Cargo crates tested with `cargo test`.
class RustRunner : public EcosystemRunner {
public:
    std::string name() const override { return "rust"; }
    EcosystemSignature detect(const CandidateProject& candidate) const override;
    InstallResult install(const CandidateProject& candidate, const EcosystemSignature& signature,
                          const RunContext& ctx) const override;
    ExecutionOutput execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                            const std::optional<std::string>& test_dir, const RunContext& ctx) const override;
    std::vector<std::string> test_file_patterns() const override;
};

// ============================================================================
// Manifest Counting
// ============================================================================

// Any line that is neither blank nor a '#' comment
bool has_manifest_content(const std::string& text);

// requirements.txt: requirement and editable lines, skipping other pip options
int count_requirement_lines(const std::string& text);

// pyproject.toml: entries of [project].dependencies plus [tool.poetry.dependencies] (minus python)
int count_pyproject_dependencies(const std::string& text);

// Pipfile: keys of [packages] and [dev-packages]
int count_pipfile_packages(const std::string& text);

// go.mod: require entries, single-line or block form
int count_go_requires(const std::string& text);

// Cargo.toml: keys of [dependencies], [dev-dependencies] and [build-dependencies]
int count_cargo_dependencies(const std::string& text);

} // namespace fcorr
