#include "fcorr/runners.hpp"
#include "runner_util.hpp"

#include <spdlog/spdlog.h>

namespace fcorr {

using namespace runners;

std::vector<std::string> GoRunner::test_file_patterns() const {
    return {"*_test.go"};
}

EcosystemSignature GoRunner::detect(const CandidateProject& candidate) const {
    EcosystemSignature sig;
    sig.name = name();
    sig.tool_family = ToolFamily::GoTest;

    if (candidate.has_file("go.mod")) {
        add_marker(sig, "go.mod", 0.4);
        sig.manifest_kind = "go.mod";
    }

    auto test_files = candidate.find_files(test_file_patterns());
    if (!test_files.empty()) {
        add_marker(sig, "test_files", 0.4);
        for (const auto& file : test_files) {
            auto text = candidate.read_file(file);
            if (text && text->find("func Test") != std::string::npos) {
                add_marker(sig, "test_functions", 0.2);
                break;
            }
        }
    }
    return sig;
}

InstallResult GoRunner::install(const CandidateProject& candidate, const EcosystemSignature& signature,
                                const RunContext& ctx) const {
    (void)signature;
    auto started = std::chrono::steady_clock::now();
    InstallResult install;
    install.success = true;

    if (!candidate.has_file("go.mod")) {
        install.manifest_status = ManifestStatus::NoneFound;
        return finish_install(install, ctx, started);
    }
    install.manifest = "go.mod";
    install.packages_installed = count_go_requires(candidate.read_file("go.mod").value_or(""));
    if (install.packages_installed == 0) {
        spdlog::debug("go: go.mod has no requirements, nothing to download");
        install.manifest_status = ManifestStatus::Empty;
        return finish_install(install, ctx, started);
    }
    install.manifest_status = ManifestStatus::Declared;

    std::vector<std::string> argv = {"go", "mod", "download"};
    auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx);
    append_step_output(install, argv, result);
    if (!step_succeeded(result)) fail_install(install, argv, result);
    return finish_install(install, ctx, started);
}

ExecutionOutput GoRunner::execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                                  const std::optional<std::string>& test_dir, const RunContext& ctx) const {
    (void)signature;
    std::string pattern = test_dir ? "./" + *test_dir + "/..." : "./...";
    std::vector<std::string> argv = {"go", "test", "-v", pattern};

    auto result = run_step(candidate, argv, ctx.timeout_ms, ctx, {{"CI", "true"}});
    return make_execution(ToolFamily::GoTest, std::move(argv), std::move(result));
}

} // namespace fcorr
