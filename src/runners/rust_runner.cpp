#include "fcorr/runners.hpp"
#include "runner_util.hpp"

#include <spdlog/spdlog.h>

namespace fcorr {

using namespace runners;

std::vector<std::string> RustRunner::test_file_patterns() const {
    return {"*.rs"};
}

EcosystemSignature RustRunner::detect(const CandidateProject& candidate) const {
    EcosystemSignature sig;
    sig.name = name();
    sig.tool_family = ToolFamily::CargoTest;

    if (candidate.has_file("Cargo.toml")) {
        add_marker(sig, "Cargo.toml", 0.4);
        sig.manifest_kind = "Cargo.toml";
    }

    bool has_tests = false;
    for (const auto& file : candidate.files_under("tests")) {
        if (glob_match("*.rs", file)) {
            has_tests = true;
            break;
        }
    }
    if (!has_tests) {
        for (const auto& file : candidate.files_under("src")) {
            if (!glob_match("*.rs", file)) continue;
            auto text = candidate.read_file(file);
            if (text && text->find("#[test]") != std::string::npos) {
                has_tests = true;
                break;
            }
        }
    }
    if (has_tests) add_marker(sig, "tests", 0.4);
    if (candidate.has_file("Cargo.lock")) add_marker(sig, "Cargo.lock", 0.1);
    return sig;
}

InstallResult RustRunner::install(const CandidateProject& candidate, const EcosystemSignature& signature,
                                  const RunContext& ctx) const {
    (void)signature;
    auto started = std::chrono::steady_clock::now();
    InstallResult install;
    install.success = true;

    if (!candidate.has_file("Cargo.toml")) {
        install.manifest_status = ManifestStatus::NoneFound;
        return finish_install(install, ctx, started);
    }
    install.manifest = "Cargo.toml";
    install.packages_installed = count_cargo_dependencies(candidate.read_file("Cargo.toml").value_or(""));
    if (install.packages_installed == 0) {
        install.manifest_status = ManifestStatus::Empty;
        return finish_install(install, ctx, started);
    }
    install.manifest_status = ManifestStatus::Declared;

    std::vector<std::string> argv = {"cargo", "fetch"};
    auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx);
    append_step_output(install, argv, result);
    if (!step_succeeded(result)) fail_install(install, argv, result);
    return finish_install(install, ctx, started);
}

ExecutionOutput RustRunner::execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                                    const std::optional<std::string>& test_dir, const RunContext& ctx) const {
    (void)signature;
    if (test_dir) spdlog::debug("rust: cargo selects test targets itself, ignoring test directory {}", *test_dir);

    std::vector<std::string> argv = {"cargo", "test", "--color", "never"};
    auto result = run_step(candidate, argv, ctx.timeout_ms, ctx, {{"CI", "true"}, {"CARGO_TERM_COLOR", "never"}});
    return make_execution(ToolFamily::CargoTest, std::move(argv), std::move(result));
}

} // namespace fcorr
