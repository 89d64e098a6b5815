#include "parse_util.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace fcorr::parsers {

namespace {

using namespace detail;

const std::string kBullet = "\xE2\x97\x8F";     // ●
const std::string kPointer = "\xE2\x9D\xAF";    // ❯
const std::string kRule = "\xE2\x8E\xAF";       // ⎯

struct Location {
    std::string file;
    int line = 0;
};

// First "at fn (file:line:col)" frame outside node_modules / node internals
std::optional<Location> first_user_frame(const std::vector<std::string>& lines) {
    static const std::regex frame(R"(^at\s+(?:.*?\()?([^()\s]+?):(\d+):(\d+)\)?\s*$)");
    for (const auto& l : lines) {
        std::string t = trim(l);
        std::smatch m;
        if (!std::regex_match(t, m, frame)) continue;
        std::string file = m[1].str();
        if (file.find("node_modules") != std::string::npos || starts_with(file, "node:") ||
            starts_with(file, "internal/")) {
            continue;
        }
        auto line = to_int(m[2].str());
        if (!line) continue;
        if (starts_with(file, "file://")) file = file.substr(7);
        return Location{file, *line};
    }
    return std::nullopt;
}

// Remove the common leading indentation of non-blank lines
std::vector<std::string> dedent(std::vector<std::string> lines) {
    size_t common = std::string::npos;
    for (const auto& l : lines) {
        if (trim(l).empty()) continue;
        size_t indent = l.find_first_not_of(" \t");
        common = std::min(common, indent);
    }
    if (common == std::string::npos || common == 0) return lines;
    for (auto& l : lines) {
        l = l.size() >= common ? l.substr(common) : trim(l);
    }
    return lines;
}

bool is_code_frame(const std::string& line) {
    static const std::regex frame(R"(^\s*>?\s*\d+\s*\|.*$)");
    static const std::regex caret(R"(^\s*\|\s*\^.*$)");
    return std::regex_match(line, frame) || std::regex_match(line, caret);
}

bool is_stack_line(const std::string& line) {
    return starts_with(trim(line), "at ");
}

// Message = lines before the first code frame or stack frame
std::string message_of(const std::vector<std::string>& body) {
    std::vector<std::string> msg;
    for (const auto& l : body) {
        if (is_code_frame(l) || is_stack_line(l)) break;
        msg.push_back(l);
    }
    msg = trim_block(dedent(msg));
    std::string out = join_lines(msg, 0, msg.size());
    return trim(out);
}

void apply_word_count(const std::string& word, int n, TestResult& result, bool& has_total) {
    if (word == "passed") {
        result.passed += n;
    } else if (word == "failed") {
        result.failed += n;
    } else if (word == "skipped" || word == "todo" || word == "pending") {
        result.skipped += n;
    } else if (word == "total") {
        result.total = n;
        has_total = true;
    }
}

bool mentions_no_tests(const std::vector<std::string>& lines) {
    for (const auto& l : lines) {
        std::string t = trim(l);
        if (starts_with(t, "No tests found") || starts_with(t, "No test files found") ||
            starts_with(t, "No test suite found")) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Jest
// ============================================================================

TestResult parse_jest(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    static const std::regex summary(R"(^Tests:\s+(.*\d+\s+total.*)$)");
    static const std::regex item(R"((\d+)\s+([A-Za-z]+))");

    bool summary_found = false;
    for (const auto& l : lines) {
        std::string t = trim(l);
        std::smatch m;
        if (!std::regex_match(t, m, summary)) continue;

        // Watch-less reruns can print more than one summary; keep the last
        summary_found = true;
        result.total = result.passed = result.failed = result.skipped = 0;
        bool has_total = false;
        std::string body = m[1].str();
        for (auto it = std::sregex_iterator(body.begin(), body.end(), item); it != std::sregex_iterator(); ++it) {
            if (auto n = to_int((*it)[1].str())) apply_word_count((*it)[2].str(), *n, result, has_total);
        }
    }

    // Failure blocks: "● Suite › name" up to the next bullet or suite banner
    std::vector<std::string> suite_errors;
    size_t i = 0;
    while (i < lines.size()) {
        std::string t = trim(lines[i]);
        if (starts_with(t, "Summary of all failing tests")) break;  // repeats earlier blocks
        if (!starts_with(t, kBullet)) {
            ++i;
            continue;
        }

        std::string title = trim(t.substr(kBullet.size()));
        size_t j = i + 1;
        while (j < lines.size()) {
            const std::string& next = lines[j];
            std::string nt = trim(next);
            if (starts_with(nt, kBullet) || starts_with(nt, "Test Suites:") || starts_with(nt, "Tests:") ||
                starts_with(nt, "Summary of all failing tests") || starts_with(next, "PASS ") ||
                starts_with(next, "FAIL ")) {
                break;
            }
            ++j;
        }
        std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                      lines.begin() + static_cast<std::ptrdiff_t>(j));
        body = trim_block(dedent(body));

        if (title == "Test suite failed to run") {
            std::string msg = message_of(body);
            suite_errors.push_back(msg.empty() ? title : msg);
        } else if (!starts_with(title, "Console")) {
            TestFailure f;
            f.test_name = title;
            f.error_message = message_of(body);
            if (f.error_message.empty()) f.error_message = "Test failed";
            if (!body.empty()) f.stack_trace = join_lines(body, 0, body.size());
            if (auto loc = first_user_frame(body)) {
                f.file_path = loc->file;
                f.line_number = loc->line;
            }
            result.failures.push_back(std::move(f));
        }
        i = j;
    }

    if (!suite_errors.empty()) {
        std::string err = "test suite failed to run: " + suite_errors.front();
        if (suite_errors.size() > 1) {
            err += " (+" + std::to_string(suite_errors.size() - 1) + " more)";
        }
        result.error = err;
        result.condition = TestCondition::BuildFailed;
        summary_found = true;
    }
    if (!summary_found && mentions_no_tests(lines)) summary_found = true;

    finish_result(result, summary_found);
    return result;
}

// ============================================================================
// Vitest
// ============================================================================

TestResult parse_vitest(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    static const std::regex summary(R"(^Tests\s+(.*?)\s*\((\d+)\)(?:\s.*)?$)");
    static const std::regex item(R"((\d+)\s+([A-Za-z]+))");
    static const std::regex location(R"(^(?:\S+\s+)?([^\s:]+):(\d+):(\d+)\s*$)");

    bool summary_found = false;
    for (const auto& l : lines) {
        std::string t = trim(l);
        std::smatch m;
        if (!std::regex_match(t, m, summary)) continue;
        summary_found = true;
        result.passed = result.failed = result.skipped = 0;
        bool has_total = false;
        std::string body = m[1].str();
        for (auto it = std::sregex_iterator(body.begin(), body.end(), item); it != std::sregex_iterator(); ++it) {
            if (auto n = to_int((*it)[1].str())) apply_word_count((*it)[2].str(), *n, result, has_total);
        }
        result.total = to_int(m[2].str()).value_or(0);
    }

    enum class Section { None, Tests, Suites };
    Section section = Section::None;
    std::vector<std::string> suite_errors;

    size_t i = 0;
    while (i < lines.size()) {
        std::string t = trim(lines[i]);
        if (t.find("Failed Tests") != std::string::npos && starts_with(t, kRule)) {
            section = Section::Tests;
            ++i;
            continue;
        }
        if (t.find("Failed Suites") != std::string::npos && starts_with(t, kRule)) {
            section = Section::Suites;
            ++i;
            continue;
        }
        if (starts_with(t, "Test Files")) section = Section::None;
        if (section == Section::None || !starts_with(t, "FAIL ")) {
            ++i;
            continue;
        }

        std::string title = trim(t.substr(4));
        size_t j = i + 1;
        while (j < lines.size()) {
            std::string nt = trim(lines[j]);
            if (starts_with(nt, "FAIL ") || starts_with(nt, kRule) || starts_with(nt, "Test Files")) break;
            ++j;
        }
        std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                      lines.begin() + static_cast<std::ptrdiff_t>(j));
        body = trim_block(body);

        std::string first_line;
        for (const auto& b : body) {
            if (!trim(b).empty()) {
                first_line = trim(b);
                break;
            }
        }

        if (section == Section::Suites) {
            suite_errors.push_back(first_line.empty() ? title : title + ": " + first_line);
        } else {
            TestFailure f;
            auto sep = title.find(" > ");
            if (sep != std::string::npos) {
                f.file_path = title.substr(0, sep);
                f.test_name = title.substr(sep + 3);
            } else {
                f.test_name = title;
            }
            f.error_message = first_line.empty() ? "Test failed" : first_line;
            if (!body.empty()) f.stack_trace = join_lines(body, 0, body.size());

            for (const auto& b : body) {
                std::string bt = trim(b);
                if (!starts_with(bt, kPointer)) continue;
                std::string rest = trim(bt.substr(kPointer.size()));
                std::smatch m;
                if (std::regex_match(rest, m, location)) {
                    f.file_path = m[1].str();
                    f.line_number = to_int(m[2].str());
                    break;
                }
            }
            result.failures.push_back(std::move(f));
        }
        i = j;
    }

    if (!suite_errors.empty()) {
        result.error = "test suite failed to run: " + suite_errors.front();
        result.condition = TestCondition::BuildFailed;
        summary_found = true;
    }
    if (!summary_found && mentions_no_tests(lines)) summary_found = true;

    finish_result(result, summary_found);
    return result;
}

// ============================================================================
// Mocha
// ============================================================================

TestResult parse_mocha(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    static const std::regex passing(R"(^(\d+)\s+passing\b.*$)");
    static const std::regex failing(R"(^(\d+)\s+failing\b.*$)");
    static const std::regex pending(R"(^(\d+)\s+pending\b.*$)");
    static const std::regex entry(R"(^(\d+)\)\s+(.*)$)");

    bool summary_found = false;
    size_t failing_at = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string t = trim(lines[i]);
        std::smatch m;
        if (std::regex_match(t, m, passing)) {
            if (auto n = to_int(m[1].str())) {
                summary_found = true;
                result.passed = *n;
            }
        } else if (std::regex_match(t, m, failing)) {
            if (auto n = to_int(m[1].str())) {
                summary_found = true;
                result.failed = *n;
                failing_at = i;
            }
        } else if (std::regex_match(t, m, pending)) {
            if (auto n = to_int(m[1].str())) result.skipped = *n;
        }
    }

    // Numbered failure entries follow the "N failing" line
    size_t i = failing_at + 1;
    while (i < lines.size()) {
        std::string t = trim(lines[i]);
        std::smatch m;
        if (!std::regex_match(t, m, entry)) {
            ++i;
            continue;
        }

        // Title spans lines until one ends with ':'
        std::vector<std::string> title_parts{trim(m[2].str())};
        size_t j = i + 1;
        bool title_closed = ends_with(title_parts.back(), ":");
        while (!title_closed && j < lines.size()) {
            std::string nt = trim(lines[j]);
            if (nt.empty()) break;
            title_parts.push_back(nt);
            title_closed = ends_with(nt, ":");
            ++j;
        }
        std::string title;
        for (const auto& p : title_parts) {
            if (!title.empty()) title += " ";
            title += p;
        }
        if (ends_with(title, ":")) title.pop_back();

        size_t k = j;
        while (k < lines.size()) {
            std::smatch em;
            std::string kt = trim(lines[k]);
            if (std::regex_match(kt, em, entry)) break;
            ++k;
        }
        std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(j),
                                      lines.begin() + static_cast<std::ptrdiff_t>(k));
        body = trim_block(dedent(body));

        TestFailure f;
        f.test_name = trim(title);
        for (const auto& b : body) {
            if (!trim(b).empty()) {
                f.error_message = trim(b);
                break;
            }
        }
        if (f.error_message.empty()) f.error_message = "Test failed";
        if (!body.empty()) f.stack_trace = join_lines(body, 0, body.size());
        if (auto loc = first_user_frame(body)) {
            f.file_path = loc->file;
            f.line_number = loc->line;
        }
        result.failures.push_back(std::move(f));
        i = k;
    }

    finish_result(result, summary_found);
    return result;
}

} // namespace fcorr::parsers
