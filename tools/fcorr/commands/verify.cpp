/**
 * fcorr CLI - verify command
 *
 * Run the full verification pipeline on one or more candidates.
 */

#include "../common.hpp"
#include <fcorr/registry.hpp>
#include <fcorr/report_json.hpp>
#include <fcorr/verifier.hpp>
#include <CLI/CLI.hpp>
#include <iomanip>
#include <vector>

namespace fcorr::cli::commands {

namespace {

struct VerifyOptions {
    std::vector<std::string> candidates;
    std::string config_path;
    std::string policy;
    long long timeout_ms = 0;
    long long install_timeout_ms = 0;
    bool no_install = false;
    bool no_build = false;
    std::string test_dir;
    int jobs = 0;
    bool expect_manifest = false;
};

void print_report(const VerificationReport& report) {
    std::cout << report.candidate << std::endl;
    if (report.ecosystem) {
        std::cout << "  Ecosystem: " << report.ecosystem->name << " ("
                  << tool_family_to_string(report.ecosystem->tool_family) << ", confidence "
                  << std::fixed << std::setprecision(2) << report.ecosystem->confidence << ")" << std::endl;
    }
    if (report.install) {
        std::cout << "  Install:   " << (report.install->success ? "ok" : "failed") << ", "
                  << report.install->packages_installed << " package(s), manifest "
                  << manifest_status_to_string(report.install->manifest_status) << std::endl;
    }
    if (report.build) {
        std::cout << "  Build:     " << (report.build->success ? "ok" : "failed") << ", "
                  << report.build->errors.size() << " error(s), " << report.build->warnings.size()
                  << " warning(s)" << std::endl;
        for (const auto& e : report.build->errors) {
            std::cout << "    ERROR " << e << std::endl;
        }
    }
    if (report.tests) {
        const auto& t = *report.tests;
        std::cout << "  Tests:     " << t.passed << " passed, " << t.failed << " failed, " << t.skipped
                  << " skipped, " << t.total << " total" << std::endl;
        for (const auto& f : t.failures) {
            std::cout << "    FAIL " << f.test_name;
            if (f.file_path) {
                std::cout << " (" << *f.file_path;
                if (f.line_number) std::cout << ":" << *f.line_number;
                std::cout << ")";
            }
            std::cout << std::endl;
            if (!f.error_message.empty()) std::cout << "         " << f.error_message << std::endl;
        }
    }
    for (const auto& w : report.warnings) {
        std::cout << "  Warning:   " << w << std::endl;
    }
    std::cout << "  Stage:     " << stage_to_string(report.final_stage);
    if (report.failed()) {
        std::cout << " (" << error_kind_to_string(report.error_kind) << ")";
    }
    std::cout << std::endl;
    if (report.error) std::cout << "  Error:     " << *report.error << std::endl;
    std::cout << "  Score:     " << std::fixed << std::setprecision(1) << report.score << " ("
              << scoring_policy_to_string(report.scoring_mode) << ")" << std::endl;
}

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts, const CLI::App* app) {
    init_logging(opts);

    auto loaded = resolve_config(verify_opts.config_path);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return kExitUsage;
    }
    VerifierConfig config = loaded.config;

    // Flags override the config file
    if (app->count("--policy")) {
        auto policy = parse_scoring_policy(verify_opts.policy);
        if (!policy) {
            print_error("unknown scoring policy: " + verify_opts.policy, opts.json);
            return kExitUsage;
        }
        config.scoring_policy = *policy;
    }
    if (app->count("--timeout-ms")) config.timeout_ms = verify_opts.timeout_ms;
    if (app->count("--install-timeout-ms")) config.install_timeout_ms = verify_opts.install_timeout_ms;
    if (verify_opts.no_install) config.auto_install = false;
    if (verify_opts.no_build) config.run_build = false;
    if (app->count("--test-dir")) config.test_dir = verify_opts.test_dir;
    if (app->count("--jobs")) config.jobs = verify_opts.jobs;
    if (verify_opts.expect_manifest) config.expect_manifest = true;

    RunnerRegistry registry = RunnerRegistry::with_default_runners();
    Verifier verifier(registry, config);
    auto reports = verify_batch(verifier, verify_opts.candidates, config.jobs);

    bool all_passed = true;
    for (const auto& r : reports) {
        if (r.failed() || r.score < 100.0) all_passed = false;
    }

    if (opts.json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : reports) {
            arr.push_back(report_to_json(r));
        }
        nlohmann::json j;
        j["ok"] = all_passed;
        j["reports"] = arr;
        output_json(j);
    } else if (!opts.quiet) {
        for (const auto& r : reports) {
            print_report(r);
        }
    }

    return all_passed ? kExitAllPassed : kExitNotAllPassed;
}

} // anonymous namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("candidates", verify_opts.candidates, "Candidate directories")->required();
    app->add_option("--config", verify_opts.config_path, "JSON configuration file");
    app->add_option("--policy", verify_opts.policy, "Scoring policy: strict or pass_rate");
    app->add_option("--timeout-ms", verify_opts.timeout_ms, "Test execution timeout")
        ->check(CLI::PositiveNumber);
    app->add_option("--install-timeout-ms", verify_opts.install_timeout_ms, "Timeout per install command")
        ->check(CLI::PositiveNumber);
    app->add_flag("--no-install", verify_opts.no_install, "Skip dependency installation");
    app->add_flag("--no-build", verify_opts.no_build, "Skip the declared build step");
    app->add_option("--test-dir", verify_opts.test_dir, "Test directory relative to each candidate");
    app->add_option("-j,--jobs", verify_opts.jobs, "Candidates verified in parallel")
        ->check(CLI::Range(1, 256));
    app->add_flag("--expect-manifest", verify_opts.expect_manifest,
                  "Warn when no dependency manifest is found");

    app->callback([&opts, app]() {
        std::exit(cmd_verify(opts, verify_opts, app));
    });
}

} // namespace fcorr::cli::commands
