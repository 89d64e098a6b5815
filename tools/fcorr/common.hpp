/**
 * fcorr CLI - Common utilities and types
 */

#pragma once

#include <fcorr/config.hpp>
#include <fcorr/log.hpp>
#include <fcorr/report_json.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#ifndef FCORR_VERSION
#define FCORR_VERSION "0.1.0"
#endif

namespace fcorr::cli {

// Exit codes shared by every command
constexpr int kExitAllPassed = 0;
constexpr int kExitNotAllPassed = 1;
constexpr int kExitUsage = 2;

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// -v wins over -q; FCORR_LOG_LEVEL overrides both
inline void init_logging(const GlobalOptions& opts) {
    log::Level level = log::Level::Warn;
    if (opts.quiet) level = log::Level::Error;
    if (opts.verbose) level = log::Level::Debug;
    log::init(level);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << dump_json(j) << std::endl;
}

/**
 * Load the configuration file, if any.
 * Priority: --config flag > FCORR_CONFIG env > built-in defaults
 */
inline ConfigParseResult resolve_config(const std::string& flag_path) {
    std::string path = flag_path;
    if (path.empty()) path = safe_getenv("FCORR_CONFIG");
    if (path.empty()) {
        ConfigParseResult defaults;
        defaults.ok = true;
        return defaults;
    }

    auto result = load_verifier_config(path);
    for (const auto& w : result.warnings) {
        spdlog::warn("{}: {}", path, w);
    }
    return result;
}

} // namespace fcorr::cli
