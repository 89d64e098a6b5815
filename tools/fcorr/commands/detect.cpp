/**
 * fcorr CLI - detect command
 *
 * Print every runner's signature for a directory and the selected one.
 */

#include "../common.hpp"
#include <fcorr/candidate.hpp>
#include <fcorr/registry.hpp>
#include <fcorr/report_json.hpp>
#include <CLI/CLI.hpp>
#include <iomanip>

namespace fcorr::cli::commands {

namespace {

struct DetectOptions {
    std::string candidate;
    double min_confidence = kDefaultMinConfidence;
};

int cmd_detect(const GlobalOptions& opts, const DetectOptions& detect_opts) {
    init_logging(opts);

    CandidateProject candidate(detect_opts.candidate);
    if (!candidate.valid()) {
        print_error("not a directory: " + detect_opts.candidate, opts.json);
        return kExitUsage;
    }

    RunnerRegistry registry = RunnerRegistry::with_default_runners();
    auto outcome = registry.select(candidate, detect_opts.min_confidence);

    if (opts.json) {
        nlohmann::json j;
        j["candidate"] = detect_opts.candidate;
        j["selected"] = outcome.selected ? nlohmann::json(outcome.selected->name) : nlohmann::json(nullptr);
        nlohmann::json sigs = nlohmann::json::array();
        for (const auto& sig : outcome.signatures) {
            sigs.push_back(signature_to_json(sig));
        }
        j["signatures"] = sigs;
        output_json(j);
    } else {
        for (const auto& sig : outcome.signatures) {
            bool selected = outcome.selected && outcome.selected->name == sig.name;
            std::cout << (selected ? "* " : "  ") << std::left << std::setw(8) << sig.name << " "
                      << std::fixed << std::setprecision(2) << sig.confidence << "  "
                      << tool_family_to_string(sig.tool_family);
            for (const auto& m : sig.markers) {
                std::cout << " " << m;
            }
            std::cout << std::endl;
        }
        if (!outcome.found()) {
            std::cout << "No compatible runner" << std::endl;
        }
    }

    return outcome.found() ? kExitAllPassed : kExitNotAllPassed;
}

} // anonymous namespace

void setup_detect(CLI::App* app, GlobalOptions& opts) {
    static DetectOptions detect_opts;

    app->add_option("candidate", detect_opts.candidate, "Candidate directory")->required();
    app->add_option("--min-confidence", detect_opts.min_confidence, "Selection threshold")
        ->check(CLI::Range(0.0, 1.0));

    app->callback([&opts]() {
        std::exit(cmd_detect(opts, detect_opts));
    });
}

} // namespace fcorr::cli::commands
