#include "parse_util.hpp"

#include <regex>
#include <set>

namespace fcorr::parsers {

namespace {

using namespace detail;

struct PanicInfo {
    std::string message;
    std::string file;
    std::optional<int> line;
};

// Both panic formats:
//   thread 'name' panicked at 'msg', src/lib.rs:10:5          (before 1.73)
//   thread 'name' panicked at src/lib.rs:10:5:                (1.73+, message follows)
std::optional<PanicInfo> parse_panic(const std::vector<std::string>& body) {
    static const std::regex legacy(R"(^thread '.*' panicked at '(.*)', ([^\s:]+):(\d+):(\d+)\s*$)");
    static const std::regex modern(R"(^thread '.*' panicked at ([^\s:]+):(\d+):(\d+):\s*$)");

    for (size_t i = 0; i < body.size(); ++i) {
        std::string t = trim(body[i]);
        std::smatch m;
        if (std::regex_match(t, m, legacy)) {
            return PanicInfo{m[1].str(), m[2].str(), to_int(m[3].str())};
        }
        if (std::regex_match(t, m, modern)) {
            PanicInfo info{"", m[1].str(), to_int(m[2].str())};
            std::vector<std::string> msg;
            for (size_t j = i + 1; j < body.size(); ++j) {
                if (starts_with(trim(body[j]), "note:")) break;
                msg.push_back(body[j]);
            }
            msg = trim_block(msg);
            info.message = join_lines(msg, 0, msg.size());
            return info;
        }
    }
    return std::nullopt;
}

} // namespace

TestResult parse_cargo_test(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    static const std::regex summary(R"(^test result: \w+\. (\d+) passed; (\d+) failed; (\d+) ignored;.*$)");
    static const std::regex failed_line(R"(^test (\S+) \.\.\. FAILED\s*$)");
    static const std::regex block_header(R"(^---- (\S+) stdout ----\s*$)");

    bool summary_found = false;
    std::vector<std::string> failed_order;
    std::optional<std::string> compile_error;
    bool build_failed = false;

    for (const auto& l : lines) {
        std::string t = trim(l);
        std::smatch m;
        if (std::regex_match(t, m, summary)) {
            auto passed = to_int(m[1].str());
            auto failed = to_int(m[2].str());
            auto ignored = to_int(m[3].str());
            if (!passed || !failed || !ignored) continue;
            summary_found = true;
            result.passed += *passed;
            result.failed += *failed;
            result.skipped += *ignored;
        } else if (std::regex_match(t, m, failed_line)) {
            failed_order.push_back(m[1].str());
        } else if (starts_with(t, "error: could not compile")) {
            build_failed = true;
        } else if (!compile_error && (starts_with(t, "error[") || starts_with(t, "error:"))) {
            compile_error = t;
        }
    }

    // "---- name stdout ----" blocks end at the next block or the trailing "failures:" list
    std::set<std::string> seen;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        std::string t = trim(lines[i]);
        if (!std::regex_match(t, m, block_header)) continue;

        size_t j = i + 1;
        while (j < lines.size()) {
            std::string nt = trim(lines[j]);
            if (starts_with(nt, "---- ") || nt == "failures:" || starts_with(nt, "test result:")) break;
            ++j;
        }
        std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                      lines.begin() + static_cast<std::ptrdiff_t>(j));
        body = trim_block(body);

        TestFailure f;
        f.test_name = m[1].str();
        if (!body.empty()) f.stack_trace = join_lines(body, 0, body.size());
        if (auto panic = parse_panic(body)) {
            f.error_message = panic->message;
            f.file_path = panic->file;
            f.line_number = panic->line;
        }
        if (f.error_message.empty()) f.error_message = "Test failed";
        seen.insert(f.test_name);
        result.failures.push_back(std::move(f));
        i = j - 1;
    }

    for (const auto& name : failed_order) {
        if (seen.count(name)) continue;
        TestFailure f;
        f.test_name = name;
        f.error_message = "Test failed";
        result.failures.push_back(std::move(f));
    }

    result.total = result.passed + result.failed + result.skipped;

    if (build_failed) {
        result.condition = TestCondition::BuildFailed;
        result.error = "build failed" + (compile_error ? ": " + *compile_error : std::string());
        summary_found = true;
    }

    finish_result(result, summary_found);
    return result;
}

} // namespace fcorr::parsers
