#include "runner_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace fcorr::runners {

std::string env_value(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += " ";
        if (arg.find(' ') != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

ProcessResult run_step(const CandidateProject& candidate, const std::vector<std::string>& argv,
                       long long timeout_ms, const RunContext& ctx,
                       const std::map<std::string, std::string>& env) {
    ProcessSpec spec;
    spec.argv = argv;
    spec.cwd = candidate.root();
    spec.env = env;
    spec.timeout_ms = timeout_ms;
    spec.max_output_bytes = ctx.max_output_bytes;

    spdlog::debug("running in {}: {}", candidate.root(), describe_command(argv));
    ProcessResult result = run_process(spec, ctx.cancel);
    spdlog::debug("{} -> exit {} in {} ms{}", argv.empty() ? "" : argv[0], result.exit_code,
                  result.duration_ms, result.timed_out ? " (timed out)" : "");
    return result;
}

std::string step_error_summary(const ProcessResult& result) {
    if (!result.launched) return result.error.empty() ? "failed to launch" : result.error;
    if (result.cancelled) return "cancelled";
    if (result.timed_out) return "timed out after " + std::to_string(result.duration_ms) + " ms";

    for (const std::string* stream : {&result.stderr_text, &result.stdout_text}) {
        size_t end = stream->size();
        while (end > 0) {
            size_t start = stream->rfind('\n', end - 1);
            start = start == std::string::npos ? 0 : start + 1;
            std::string line = stream->substr(start, end - start);
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);
            if (!line.empty()) return line;
            if (start == 0) break;
            end = start - 1;
        }
    }
    return "exit code " + std::to_string(result.exit_code);
}

bool step_succeeded(const ProcessResult& result) {
    return result.launched && !result.timed_out && !result.cancelled && result.exit_code == 0;
}

void append_step_output(InstallResult& install, const std::vector<std::string>& argv,
                        const ProcessResult& result) {
    if (!install.output.empty() && install.output.back() != '\n') install.output += '\n';
    install.output += "$ " + describe_command(argv) + "\n";
    if (!result.launched) {
        install.output += result.error + "\n";
        return;
    }
    install.output += result.combined_output();
}

void fail_install(InstallResult& install, const std::vector<std::string>& argv, const ProcessResult& result) {
    install.success = false;
    install.error_summary = step_error_summary(result);
    spdlog::warn("install step failed: {}: {}", describe_command(argv), *install.error_summary);
}

InstallResult finish_install(InstallResult install, const RunContext& ctx,
                             std::chrono::steady_clock::time_point started) {
    if (install.manifest_status == ManifestStatus::NoneFound && ctx.expect_manifest) {
        install.warnings.push_back("expected dependency manifest not found");
    }
    install.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return install;
}

BuildResult run_build_step(const CandidateProject& candidate, const std::vector<std::string>& argv,
                           const RunContext& ctx, const std::map<std::string, std::string>& env) {
    BuildResult build;
    build.command = argv;

    auto result = run_step(candidate, argv, ctx.install_timeout_ms, ctx, env);
    build.duration_ms = result.duration_ms;
    build.output = result.launched ? result.combined_output() : result.error;
    build.success = step_succeeded(result);

    auto diag = parsers::parse_build_output(build.output);
    build.errors = std::move(diag.errors);
    build.warnings = std::move(diag.warnings);

    if (!build.success) {
        // The first extracted error says more than the last output line
        if (result.launched && !result.timed_out && !result.cancelled && !build.errors.empty()) {
            build.error_summary = build.errors.front();
        } else {
            build.error_summary = step_error_summary(result);
        }
        spdlog::warn("build failed: {}: {}", describe_command(argv), *build.error_summary);
    } else {
        spdlog::info("build succeeded: {} ({} warning(s))", describe_command(argv), build.warnings.size());
    }
    return build;
}

ExecutionOutput make_execution(ToolFamily family, std::vector<std::string> argv, ProcessResult process) {
    ExecutionOutput out;
    out.raw.family = family;
    out.raw.text = process.combined_output();
    out.raw.exit_code = process.exit_code;
    out.raw.duration_ms = process.duration_ms;
    out.raw.timed_out = process.timed_out;
    out.command = std::move(argv);
    out.process = std::move(process);
    return out;
}

void add_marker(EcosystemSignature& signature, const std::string& marker, double weight) {
    if (!signature.markers.insert(marker).second) return;
    signature.confidence = std::min(1.0, signature.confidence + weight);
}

} // namespace fcorr::runners
