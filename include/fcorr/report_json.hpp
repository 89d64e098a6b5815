#pragma once

#include "fcorr/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fcorr {

// Full report, every field included; absent optionals become null.
nlohmann::json report_to_json(const VerificationReport& report);

// The failure list alone, traces untruncated
nlohmann::json failures_to_json(const std::vector<TestFailure>& failures);

nlohmann::json signature_to_json(const EcosystemSignature& signature);
nlohmann::json install_to_json(const InstallResult& install);
nlohmann::json build_to_json(const BuildResult& build);
nlohmann::json test_result_to_json(const TestResult& tests);

// Serialized text. Test output is not guaranteed UTF-8; invalid bytes
// become U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& j, int indent = 2);

} // namespace fcorr
