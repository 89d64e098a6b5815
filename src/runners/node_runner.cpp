#include "fcorr/runners.hpp"
#include "runner_util.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <set>

namespace fcorr {

namespace {

using namespace runners;

const std::vector<std::string> kTestFilePatterns = {
    "*.test.ts", "*.test.tsx", "*.test.js", "*.test.jsx", "*.test.mjs", "*.test.cjs",
    "*.spec.ts", "*.spec.tsx", "*.spec.js", "*.spec.jsx",
};

const std::vector<std::string> kJestProvision = {"jest", "ts-jest", "@types/jest", "@jest/globals"};

struct PackageJson {
    bool ok = false;
    std::string error;
    std::set<std::string> dependencies;
    std::set<std::string> dev_dependencies;
    std::optional<std::string> test_script;
    std::optional<std::string> build_script;  // name of the script, "build" or "compile"
    bool has_jest_config = false;  // "jest" key
};

// Helper to safely collect the keys of an object member
std::set<std::string> get_object_keys(const nlohmann::json& j, const std::string& key) {
    std::set<std::string> keys;
    if (j.contains(key) && j[key].is_object()) {
        for (auto it = j[key].begin(); it != j[key].end(); ++it) {
            keys.insert(it.key());
        }
    }
    return keys;
}

PackageJson read_package_json(const CandidateProject& candidate) {
    PackageJson pkg;
    auto text = candidate.read_file("package.json");
    if (!text) {
        pkg.error = "package.json not readable";
        return pkg;
    }

    try {
        auto j = nlohmann::json::parse(*text);
        if (!j.is_object()) {
            pkg.error = "package.json must be an object";
            return pkg;
        }
        pkg.dependencies = get_object_keys(j, "dependencies");
        pkg.dev_dependencies = get_object_keys(j, "devDependencies");
        if (j.contains("scripts") && j["scripts"].is_object()) {
            const auto& scripts = j["scripts"];
            if (scripts.contains("test") && scripts["test"].is_string()) {
                std::string script = scripts["test"].get<std::string>();
                // npm init placeholder
                if (script.find("no test specified") == std::string::npos) pkg.test_script = script;
            }
            for (const char* name : {"build", "compile"}) {
                if (scripts.contains(name) && scripts[name].is_string()) {
                    pkg.build_script = name;
                    break;
                }
            }
        }
        pkg.has_jest_config = j.contains("jest");
        pkg.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        pkg.error = std::string("invalid package.json: ") + e.what();
    }
    return pkg;
}

bool declares(const PackageJson& pkg, const std::string& name) {
    return pkg.dependencies.count(name) > 0 || pkg.dev_dependencies.count(name) > 0;
}

std::optional<ToolFamily> framework_in_text(const std::string& text) {
    if (text.find("vitest") != std::string::npos) return ToolFamily::Vitest;
    if (text.find("jest") != std::string::npos) return ToolFamily::Jest;
    if (text.find("mocha") != std::string::npos) return ToolFamily::Mocha;
    return std::nullopt;
}

std::optional<ToolFamily> declared_framework(const PackageJson& pkg) {
    if (declares(pkg, "vitest")) return ToolFamily::Vitest;
    if (declares(pkg, "jest") || declares(pkg, "ts-jest") || declares(pkg, "@jest/globals")) {
        return ToolFamily::Jest;
    }
    if (declares(pkg, "mocha")) return ToolFamily::Mocha;
    return std::nullopt;
}

bool has_jest_config_file(const CandidateProject& candidate) {
    for (const char* name : {"jest.config.js", "jest.config.ts", "jest.config.mjs", "jest.config.cjs",
                             "jest.config.json"}) {
        if (candidate.has_file(name)) return true;
    }
    return false;
}

bool has_typescript_tests(const CandidateProject& candidate) {
    return !candidate.find_files({"*.test.ts", "*.test.tsx", "*.spec.ts", "*.spec.tsx"}).empty();
}

// jest will be installed on the fly when the project relies on it without declaring it
bool needs_jest_provision(const CandidateProject& candidate, const EcosystemSignature& signature,
                          const PackageJson& pkg) {
    return signature.tool_family == ToolFamily::Jest && !declares(pkg, "jest") &&
           !candidate.has_directory("node_modules/jest");
}

} // namespace

std::vector<std::string> NodeRunner::test_file_patterns() const {
    return kTestFilePatterns;
}

EcosystemSignature NodeRunner::detect(const CandidateProject& candidate) const {
    EcosystemSignature sig;
    sig.name = name();
    sig.tool_family = ToolFamily::Jest;

    // Without package.json there is nothing npm can run
    if (!candidate.has_file("package.json")) return sig;
    add_marker(sig, "package.json", 0.3);
    sig.manifest_kind = "package.json";

    auto pkg = read_package_json(candidate);
    if (!pkg.ok) spdlog::debug("node: {}", pkg.error);

    std::optional<ToolFamily> family;
    if (pkg.test_script) family = framework_in_text(*pkg.test_script);
    if (auto declared = declared_framework(pkg)) {
        add_marker(sig, "framework_declared", 0.3);
        if (!family) family = declared;
    }
    if (pkg.test_script) add_marker(sig, "test_script", 0.2);

    auto test_files = candidate.find_files(kTestFilePatterns);
    if (!test_files.empty()) {
        add_marker(sig, "test_files", 0.3);
        for (size_t i = 0; !family && i < test_files.size() && i < 5; ++i) {
            auto text = candidate.read_file(test_files[i]);
            if (!text) continue;
            if (text->find("from 'vitest'") != std::string::npos ||
                text->find("from \"vitest\"") != std::string::npos) {
                family = ToolFamily::Vitest;
            } else if (text->find("@jest/globals") != std::string::npos) {
                family = ToolFamily::Jest;
            }
        }
    }
    if (candidate.has_file("tsconfig.json")) add_marker(sig, "tsconfig.json", 0.1);

    sig.tool_family = family.value_or(ToolFamily::Jest);
    return sig;
}

InstallResult NodeRunner::install(const CandidateProject& candidate, const EcosystemSignature& signature,
                                  const RunContext& ctx) const {
    auto started = std::chrono::steady_clock::now();
    InstallResult install;
    install.success = true;

    if (!candidate.has_file("package.json")) {
        install.manifest_status = ManifestStatus::NoneFound;
        return finish_install(install, ctx, started);
    }
    install.manifest = "package.json";

    auto pkg = read_package_json(candidate);
    if (!pkg.ok) {
        install.success = false;
        install.error_summary = pkg.error;
        install.output = pkg.error;
        spdlog::warn("node: {}", pkg.error);
        return finish_install(install, ctx, started);
    }

    install.packages_installed = static_cast<int>(pkg.dependencies.size() + pkg.dev_dependencies.size());
    install.manifest_status = install.packages_installed > 0 ? ManifestStatus::Declared : ManifestStatus::Empty;

    std::map<std::string, std::string> env = {{"CI", "true"}, {"npm_config_fund", "false"},
                                              {"npm_config_audit", "false"}};

    if (candidate.has_directory("node_modules")) {
        spdlog::debug("node: node_modules present, skipping install");
    } else if (install.manifest_status == ManifestStatus::Declared) {
        std::vector<std::string> argv;
        if (candidate.has_file("package-lock.json")) {
            argv = {"npm", "ci"};
        } else if (candidate.has_file("yarn.lock")) {
            argv = {"yarn", "install", "--frozen-lockfile"};
        } else if (candidate.has_file("pnpm-lock.yaml")) {
            argv = {"pnpm", "install", "--frozen-lockfile"};
        } else {
            argv = {"npm", "install"};
        }

        auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx, env);
        append_step_output(install, argv, result);
        if (!step_succeeded(result)) {
            fail_install(install, argv, result);
            return finish_install(install, ctx, started);
        }
    }

    if (needs_jest_provision(candidate, signature, pkg)) {
        std::vector<std::string> argv = {"npm", "install", "--no-save"};
        argv.insert(argv.end(), kJestProvision.begin(), kJestProvision.end());

        spdlog::info("node: jest not declared, provisioning it");
        auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx, env);
        append_step_output(install, argv, result);
        if (!step_succeeded(result)) {
            fail_install(install, argv, result);
            return finish_install(install, ctx, started);
        }
        install.packages_installed += static_cast<int>(kJestProvision.size());
        install.warnings.push_back("jest was not declared; installed without saving");
    }

    return finish_install(install, ctx, started);
}

std::optional<BuildResult> NodeRunner::build(const CandidateProject& candidate, const EcosystemSignature& signature,
                                            const RunContext& ctx) const {
    (void)signature;
    if (!candidate.has_file("package.json")) return std::nullopt;
    auto pkg = read_package_json(candidate);
    if (!pkg.ok || !pkg.build_script) return std::nullopt;

    std::vector<std::string> argv = {"npm", "run", *pkg.build_script};
    std::map<std::string, std::string> env = {{"CI", "true"}, {"FORCE_COLOR", "0"}, {"NO_COLOR", "1"}};
    return run_build_step(candidate, argv, ctx, env);
}

ExecutionOutput NodeRunner::execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                                    const std::optional<std::string>& test_dir, const RunContext& ctx) const {
    auto pkg = read_package_json(candidate);

    std::vector<std::string> argv;
    if (pkg.test_script) {
        argv = {"npm", "test"};
        if (test_dir) spdlog::debug("node: test directory ignored when running the test script");
    } else {
        switch (signature.tool_family) {
            case ToolFamily::Vitest:
                argv = {"npx", "vitest", "run"};
                break;
            case ToolFamily::Mocha:
                argv = {"npx", "mocha"};
                if (test_dir) argv.push_back("--recursive");
                break;
            case ToolFamily::Jest:
            default:
                argv = {"npx", "jest", "--ci", "--no-coverage"};
                if (!declares(pkg, "jest") && !pkg.has_jest_config && !has_jest_config_file(candidate) &&
                    has_typescript_tests(candidate)) {
                    argv.push_back("--preset");
                    argv.push_back("ts-jest");
                }
                break;
        }
        if (test_dir) argv.push_back(*test_dir);
    }

    std::map<std::string, std::string> env = {{"CI", "true"}, {"FORCE_COLOR", "0"}, {"NO_COLOR", "1"}};
    auto result = run_step(candidate, argv, ctx.timeout_ms, ctx, env);
    return make_execution(signature.tool_family, std::move(argv), std::move(result));
}

} // namespace fcorr
