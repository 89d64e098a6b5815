#include "parse_util.hpp"

namespace fcorr {

TestResult parse_output(const RawOutput& raw) {
    TestResult result;
    switch (raw.family) {
        case ToolFamily::Pytest: result = parsers::parse_pytest(raw); break;
        case ToolFamily::Jest: result = parsers::parse_jest(raw); break;
        case ToolFamily::Vitest: result = parsers::parse_vitest(raw); break;
        case ToolFamily::Mocha: result = parsers::parse_mocha(raw); break;
        case ToolFamily::GoTest: result = parsers::parse_go_test(raw); break;
        case ToolFamily::CargoTest: result = parsers::parse_cargo_test(raw); break;
        case ToolFamily::Unknown:
        default:
            result = parsers::detail::begin_result(raw);
            result.error = "no parser for tool family '" + std::string(tool_family_to_string(raw.family)) + "'";
            parsers::detail::finish_result(result, false);
            break;
    }

    // Partial output may still carry counts, but a timed-out run never succeeds
    if (raw.timed_out) {
        result.timed_out = true;
        result.success = false;
        result.condition = TestCondition::TimedOut;
        result.error = "test execution timed out after " + std::to_string(raw.duration_ms) + " ms";
    }
    return result;
}

} // namespace fcorr
