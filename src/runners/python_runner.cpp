#include "fcorr/runners.hpp"
#include "runner_util.hpp"

#include <spdlog/spdlog.h>

namespace fcorr {

namespace {

using namespace runners;

// Detection order; the first three double as install priority
const std::vector<std::string>& python_manifests() {
    static const std::vector<std::string> manifests = {
        "requirements.txt", "pyproject.toml", "setup.py", "Pipfile", "setup.cfg",
    };
    return manifests;
}

std::string venv_python(const CandidateProject& candidate) {
    return candidate.path_of(std::string(PythonRunner::kVenvDir) + "/bin/python");
}

std::string system_python() {
    std::string path = env_value("PATH");
    if (!find_executable("python3", path).empty()) return "python3";
    return "python";
}

// Interpreter used for tests: the private environment once it exists
std::string select_python(const CandidateProject& candidate, const RunContext& ctx) {
    if (ctx.isolate_python_env && candidate.has_file(std::string(PythonRunner::kVenvDir) + "/bin/python")) {
        return venv_python(candidate);
    }
    return system_python();
}

std::map<std::string, std::string> venv_env(const CandidateProject& candidate, const RunContext& ctx) {
    std::map<std::string, std::string> env;
    if (ctx.isolate_python_env && candidate.has_directory(PythonRunner::kVenvDir)) {
        std::string bin = candidate.path_of(std::string(PythonRunner::kVenvDir) + "/bin");
        std::string path = env_value("PATH");
        env["PATH"] = path.empty() ? bin : bin + ":" + path;
        env["VIRTUAL_ENV"] = candidate.path_of(PythonRunner::kVenvDir);
    }
    env["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
    return env;
}

} // namespace

std::vector<std::string> PythonRunner::test_file_patterns() const {
    return {"test_*.py", "*_test.py"};
}

EcosystemSignature PythonRunner::detect(const CandidateProject& candidate) const {
    EcosystemSignature sig;
    sig.name = name();
    sig.tool_family = ToolFamily::Pytest;

    bool pytest_declared = false;
    for (const auto& manifest : python_manifests()) {
        if (!candidate.has_file(manifest)) continue;
        add_marker(sig, "manifest", 0.3);
        sig.markers.insert(manifest);
        if (sig.manifest_kind.empty() && manifest != "setup.cfg") sig.manifest_kind = manifest;

        auto text = candidate.read_file(manifest);
        if (text && text->find("pytest") != std::string::npos) pytest_declared = true;
    }

    if (!candidate.find_files(test_file_patterns()).empty()) {
        add_marker(sig, "test_files", 0.4);
    }
    if (!candidate.find_files({"conftest.py"}).empty()) {
        add_marker(sig, "conftest.py", 0.2);
    }
    if (pytest_declared) {
        add_marker(sig, "pytest_declared", 0.2);
    }
    return sig;
}

InstallResult PythonRunner::install(const CandidateProject& candidate, const EcosystemSignature& signature,
                                    const RunContext& ctx) const {
    (void)signature;
    auto started = std::chrono::steady_clock::now();
    InstallResult install;
    install.success = true;

    // Fixed priority: requirements.txt, pyproject.toml, setup.py, Pipfile.
    // Package counts are informational; pip decides what the manifest needs.
    std::vector<std::string> pip_args;
    bool use_pipenv = false;
    std::string text;
    if (candidate.has_file("requirements.txt")) {
        install.manifest = "requirements.txt";
        text = candidate.read_file("requirements.txt").value_or("");
        install.packages_installed = count_requirement_lines(text);
        pip_args = {"install", "-r", "requirements.txt"};
    } else if (candidate.has_file("pyproject.toml")) {
        install.manifest = "pyproject.toml";
        text = candidate.read_file("pyproject.toml").value_or("");
        install.packages_installed = count_pyproject_dependencies(text);
        pip_args = {"install", "-e", "."};
    } else if (candidate.has_file("setup.py")) {
        install.manifest = "setup.py";
        text = candidate.read_file("setup.py").value_or("");
        pip_args = {"install", "-e", "."};
    } else if (candidate.has_file("Pipfile")) {
        install.manifest = "Pipfile";
        text = candidate.read_file("Pipfile").value_or("");
        install.packages_installed = count_pipfile_packages(text);
        use_pipenv = true;
    }

    if (!install.manifest) {
        install.manifest_status = ManifestStatus::NoneFound;
        spdlog::debug("python: no dependency manifest in {}", candidate.root());
        return finish_install(install, ctx, started);
    }

    if (!has_manifest_content(text)) {
        install.manifest_status = ManifestStatus::Empty;
        spdlog::debug("python: {} is empty", *install.manifest);
        return finish_install(install, ctx, started);
    }
    install.manifest_status = ManifestStatus::Declared;

    if (ctx.isolate_python_env && !candidate.has_directory(kVenvDir)) {
        // System site-packages stay visible so a globally installed pytest keeps working
        std::vector<std::string> argv = {system_python(), "-m", "venv", "--system-site-packages", kVenvDir};
        auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx);
        append_step_output(install, argv, result);
        if (!step_succeeded(result)) {
            fail_install(install, argv, result);
            return finish_install(install, ctx, started);
        }
    }

    std::vector<std::string> argv;
    if (use_pipenv) {
        argv = {"pipenv", "install", "--dev", "--system"};
    } else {
        argv = {select_python(candidate, ctx), "-m", "pip"};
        argv.insert(argv.end(), pip_args.begin(), pip_args.end());
        argv.push_back("-q");
    }

    auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx, venv_env(candidate, ctx));
    append_step_output(install, argv, result);
    if (!step_succeeded(result)) {
        fail_install(install, argv, result);
    } else {
        spdlog::info("python: installed from {} ({} declared package(s))", *install.manifest,
                     install.packages_installed);
    }
    return finish_install(install, ctx, started);
}

ExecutionOutput PythonRunner::execute(const CandidateProject& candidate, const EcosystemSignature& signature,
                                      const std::optional<std::string>& test_dir, const RunContext& ctx) const {
    (void)signature;
    std::vector<std::string> argv = {
        select_python(candidate, ctx), "-m", "pytest", "-v", "--tb=short", "-rfE", "-p", "no:cacheprovider",
    };
    if (test_dir) argv.push_back(*test_dir);

    auto env = venv_env(candidate, ctx);
    std::string pythonpath = env_value("PYTHONPATH");
    env["PYTHONPATH"] = pythonpath.empty() ? candidate.root() : candidate.root() + ":" + pythonpath;
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["CI"] = "true";

    auto result = run_step(candidate, argv, ctx.timeout_ms, ctx, env);
    return make_execution(ToolFamily::Pytest, std::move(argv), std::move(result));
}

} // namespace fcorr
