#pragma once

#include "fcorr/runner.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace fcorr::runners {

// Value of an environment variable, empty when unset
std::string env_value(const char* name);

// Printable command line for logs and reports
std::string describe_command(const std::vector<std::string>& argv);

/**
 * Run one step of install/execute in the candidate root.
 * Env entries are merged over the parent environment.
 */
ProcessResult run_step(const CandidateProject& candidate, const std::vector<std::string>& argv,
                       long long timeout_ms, const RunContext& ctx,
                       const std::map<std::string, std::string>& env = {});

// One-line reason for a failed step: launch error, timeout, last stderr line
std::string step_error_summary(const ProcessResult& result);

bool step_succeeded(const ProcessResult& result);

// Append a step's output to an install record, with a "$ command" header
void append_step_output(InstallResult& install, const std::vector<std::string>& argv,
                        const ProcessResult& result);

// Mark an install as failed from a step result
void fail_install(InstallResult& install, const std::vector<std::string>& argv, const ProcessResult& result);

// Final bookkeeping shared by every installer
InstallResult finish_install(InstallResult install, const RunContext& ctx,
                             std::chrono::steady_clock::time_point started);

// Run a build command and collect its diagnostics
BuildResult run_build_step(const CandidateProject& candidate, const std::vector<std::string>& argv,
                           const RunContext& ctx, const std::map<std::string, std::string>& env = {});

// Build an ExecutionOutput from a finished test command
ExecutionOutput make_execution(ToolFamily family, std::vector<std::string> argv, ProcessResult process);

// Confidence is additive per marker and capped at 1.0
void add_marker(EcosystemSignature& signature, const std::string& marker, double weight);

} // namespace fcorr::runners
