#include "fcorr/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace fcorr {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ToolFamily> parse_tool_family(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "pytest") return ToolFamily::Pytest;
    if (lower == "jest") return ToolFamily::Jest;
    if (lower == "vitest") return ToolFamily::Vitest;
    if (lower == "mocha") return ToolFamily::Mocha;
    if (lower == "go_test" || lower == "gotest") return ToolFamily::GoTest;
    if (lower == "cargo_test" || lower == "cargotest") return ToolFamily::CargoTest;

    return std::nullopt;
}

std::optional<ScoringPolicy> parse_scoring_policy(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "strict") return ScoringPolicy::Strict;
    if (lower == "pass_rate" || lower == "pass-rate" || lower == "passrate") {
        return ScoringPolicy::PassRate;
    }
    return std::nullopt;
}

} // namespace fcorr
