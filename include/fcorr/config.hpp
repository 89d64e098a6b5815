#pragma once

#include "fcorr/registry.hpp"
#include "fcorr/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Verifier Configuration
// ============================================================================

struct VerifierConfig {
    long long timeout_ms = 300000;             // test execution
    long long install_timeout_ms = 600000;     // each install command
    ScoringPolicy scoring_policy = ScoringPolicy::Strict;
    bool auto_install = true;
    bool run_build = true;                     // declared build step before tests
    std::optional<std::string> test_dir;       // relative to the candidate root
    double min_confidence = kDefaultMinConfidence;
    bool isolate_python_env = true;
    std::size_t max_output_bytes = 32u * 1024u * 1024u;
    bool expect_manifest = false;
    int jobs = 1;                              // verify_batch workers
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    VerifierConfig config;
    std::vector<std::string> warnings;
};

/**
 * Parse a JSON configuration document.
 *
 * Keys absent from the document keep their defaults. Unknown keys are
 * warnings; wrong types and out-of-range values are errors.
 */
ConfigParseResult parse_verifier_config(const std::string& json_str);

// Read and parse a configuration file
ConfigParseResult load_verifier_config(const std::string& path);

} // namespace fcorr
