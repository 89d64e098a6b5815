/**
 * fcorr CLI - Entry Point
 *
 * Functional-correctness verification of candidate projects.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace fcorr::cli::commands {
    void setup_verify(CLI::App* app, GlobalOptions& opts);
    void setup_detect(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace fcorr::cli;

    CLI::App app{"fcorr - functional-correctness verification"};
    app.set_version_flag("-V,--version", FCORR_VERSION);
    app.require_subcommand(1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* verify_cmd = app.add_subcommand("verify", "Verify candidate directories and score them");
    commands::setup_verify(verify_cmd, opts);

    auto* detect_cmd = app.add_subcommand("detect", "Show ecosystem detection for a directory");
    commands::setup_detect(detect_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? kExitAllPassed : kExitUsage;
    }
    return kExitAllPassed;
}
