#include "fcorr/report_json.hpp"

namespace fcorr {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (value) return *value;
    return nullptr;
}

} // namespace

nlohmann::json signature_to_json(const EcosystemSignature& signature) {
    nlohmann::json j;
    j["name"] = signature.name;
    j["confidence"] = signature.confidence;
    j["markers"] = signature.markers;
    j["tool_family"] = tool_family_to_string(signature.tool_family);
    j["manifest_kind"] = signature.manifest_kind.empty() ? nlohmann::json(nullptr)
                                                         : nlohmann::json(signature.manifest_kind);
    return j;
}

nlohmann::json install_to_json(const InstallResult& install) {
    nlohmann::json j;
    j["success"] = install.success;
    j["duration_ms"] = install.duration_ms;
    j["packages_installed"] = install.packages_installed;
    j["manifest_status"] = manifest_status_to_string(install.manifest_status);
    j["manifest"] = optional_to_json(install.manifest);
    j["error_summary"] = optional_to_json(install.error_summary);
    j["warnings"] = install.warnings;
    j["output"] = install.output;
    return j;
}

nlohmann::json build_to_json(const BuildResult& build) {
    nlohmann::json j;
    j["success"] = build.success;
    j["duration_ms"] = build.duration_ms;
    j["command"] = build.command;
    j["errors"] = build.errors;
    j["warnings"] = build.warnings;
    j["error_summary"] = optional_to_json(build.error_summary);
    j["output"] = build.output;
    return j;
}

nlohmann::json failures_to_json(const std::vector<TestFailure>& failures) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : failures) {
        nlohmann::json j;
        j["test_name"] = f.test_name;
        j["file_path"] = optional_to_json(f.file_path);
        j["line_number"] = optional_to_json(f.line_number);
        j["error_message"] = f.error_message;
        j["stack_trace"] = optional_to_json(f.stack_trace);
        arr.push_back(std::move(j));
    }
    return arr;
}

nlohmann::json test_result_to_json(const TestResult& tests) {
    nlohmann::json j;
    j["success"] = tests.success;
    j["total"] = tests.total;
    j["passed"] = tests.passed;
    j["failed"] = tests.failed;
    j["skipped"] = tests.skipped;
    j["pass_rate"] = tests.pass_rate();
    j["duration_ms"] = tests.duration_ms;
    j["exit_code"] = tests.exit_code;
    j["timed_out"] = tests.timed_out;
    j["condition"] = test_condition_to_string(tests.condition);
    j["error"] = optional_to_json(tests.error);
    j["failures"] = failures_to_json(tests.failures);
    j["raw_output"] = tests.raw_output;
    return j;
}

nlohmann::json report_to_json(const VerificationReport& report) {
    nlohmann::json j;
    j["candidate"] = report.candidate;
    j["score"] = report.score;
    j["scoring_mode"] = scoring_policy_to_string(report.scoring_mode);
    j["final_stage"] = stage_to_string(report.final_stage);
    j["error_kind"] = error_kind_to_string(report.error_kind);
    j["error"] = optional_to_json(report.error);
    j["duration_ms"] = report.duration_ms;
    j["warnings"] = report.warnings;

    j["ecosystem"] = report.ecosystem ? signature_to_json(*report.ecosystem) : nlohmann::json(nullptr);

    nlohmann::json detections = nlohmann::json::array();
    for (const auto& sig : report.detections) {
        detections.push_back(signature_to_json(sig));
    }
    j["detections"] = detections;

    j["install"] = report.install ? install_to_json(*report.install) : nlohmann::json(nullptr);
    j["build"] = report.build ? build_to_json(*report.build) : nlohmann::json(nullptr);
    j["tests"] = report.tests ? test_result_to_json(*report.tests) : nlohmann::json(nullptr);
    return j;
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace fcorr
