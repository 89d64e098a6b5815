#include "parse_util.hpp"

#include <map>
#include <regex>
#include <set>

namespace fcorr::parsers {

namespace {

using namespace detail;

struct GoOutcome {
    std::string name;
    std::string status;  // PASS, FAIL, SKIP
};

struct GoMessage {
    std::string file;
    std::optional<int> line;
    std::string text;
    std::vector<std::string> trace;
};

size_t indent_of(const std::string& line) {
    size_t n = line.find_first_not_of(" \t");
    return n == std::string::npos ? line.size() : n;
}

// Subtest names are "Parent/child"; the set is sorted so descendants follow parent + "/"
bool has_descendant(const std::set<std::string>& names, const std::string& parent) {
    auto it = names.lower_bound(parent + "/");
    return it != names.end() && starts_with(*it, parent + "/");
}

} // namespace

TestResult parse_go_test(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    static const std::regex run_line(R"(^=== (?:RUN|CONT|PAUSE|NAME)\s+(\S+)\s*$)");
    static const std::regex outcome_line(R"(^\s*--- (PASS|FAIL|SKIP): (\S+) \([0-9.]+s\)\s*$)");
    static const std::regex package_line(R"(^(ok|FAIL|\?)\s+(\S+)\s*(.*)$)");
    static const std::regex message_line(R"(^\s+([A-Za-z0-9_./\-]+_test\.go):(\d+):\s?(.*)$)");

    std::vector<GoOutcome> outcomes;
    std::map<std::string, std::vector<GoMessage>> messages;
    std::string current;
    std::optional<std::string> panic_line;
    std::optional<std::string> build_error;
    bool summary_found = false;
    bool build_failed = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        std::smatch m;

        if (std::regex_match(line, m, run_line)) {
            current = m[1].str();
            continue;
        }
        if (std::regex_match(line, m, outcome_line)) {
            summary_found = true;
            outcomes.push_back({m[2].str(), m[1].str()});
            // Older toolchains print a failing test's log after its result line
            current = m[2].str();
            continue;
        }
        if (std::regex_match(line, m, message_line)) {
            GoMessage msg;
            msg.file = m[1].str();
            msg.line = to_int(m[2].str());
            msg.text = trim(m[3].str());
            msg.trace.push_back(trim(line));

            // testify and friends continue on deeper-indented lines
            size_t base = indent_of(line);
            while (i + 1 < lines.size() && !trim(lines[i + 1]).empty() && indent_of(lines[i + 1]) > base &&
                   !std::regex_match(lines[i + 1], outcome_line)) {
                ++i;
                msg.trace.push_back(trim(lines[i]));
                if (msg.text.empty()) msg.text = trim(lines[i]);
            }
            messages[current].push_back(std::move(msg));
            continue;
        }
        if (starts_with(line, "panic: ") && !panic_line) {
            panic_line = trim(line);
            continue;
        }
        if (starts_with(line, "# ") && !build_error) {
            // "# pkg" header followed by compiler diagnostics
            if (i + 1 < lines.size() && !trim(lines[i + 1]).empty()) {
                build_error = trim(lines[i + 1]);
            }
            continue;
        }
        if (trim(line) == "no packages to test" || line.find("matched no packages") != std::string::npos) {
            // The package pattern selected nothing: a summary with zero tests
            summary_found = true;
            continue;
        }
        if (std::regex_match(line, m, package_line)) {
            std::string tail = m[3].str();
            if (tail.find("[build failed]") != std::string::npos ||
                tail.find("[setup failed]") != std::string::npos) {
                build_failed = true;
                summary_found = true;
            } else if (m[1].str() == "?" && tail.find("[no test files]") != std::string::npos) {
                summary_found = true;
            } else if (m[1].str() != "?" && m[2].str() != "") {
                summary_found = true;
            }
        }
    }

    std::set<std::string> names;
    for (const auto& o : outcomes) names.insert(o.name);

    std::set<std::string> failed_names;
    for (const auto& o : outcomes) {
        if (o.status == "FAIL") failed_names.insert(o.name);
    }

    for (const auto& o : outcomes) {
        bool parent = has_descendant(names, o.name);
        if (parent) {
            // A parent failing on its own (all subtests passed) still counts once
            if (o.status != "FAIL") continue;
            bool child_failed = false;
            for (const auto& f : failed_names) {
                if (starts_with(f, o.name + "/")) {
                    child_failed = true;
                    break;
                }
            }
            if (child_failed) continue;
        }

        if (o.status == "PASS") {
            result.passed++;
        } else if (o.status == "SKIP") {
            result.skipped++;
        } else {
            result.failed++;

            TestFailure f;
            f.test_name = o.name;
            auto it = messages.find(o.name);
            if (it != messages.end() && !it->second.empty()) {
                const auto& first = it->second.front();
                f.file_path = first.file;
                f.line_number = first.line;
                f.error_message = first.text;
                std::vector<std::string> trace;
                for (const auto& msg : it->second) {
                    trace.insert(trace.end(), msg.trace.begin(), msg.trace.end());
                }
                f.stack_trace = join_lines(trace, 0, trace.size());
            }
            if (f.error_message.empty() && panic_line) f.error_message = *panic_line;
            if (f.error_message.empty()) f.error_message = "Test failed";
            result.failures.push_back(std::move(f));
        }
    }
    result.total = result.passed + result.failed + result.skipped;

    if (build_failed) {
        result.condition = TestCondition::BuildFailed;
        result.error = "build failed" + (build_error ? ": " + *build_error : std::string());
    }

    finish_result(result, summary_found);
    return result;
}

} // namespace fcorr::parsers
