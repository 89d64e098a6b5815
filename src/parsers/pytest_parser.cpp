#include "parse_util.hpp"

#include <cctype>
#include <map>
#include <regex>

namespace fcorr::parsers {

namespace {

using namespace detail;

struct TraceBlock {
    std::string header;
    std::vector<std::string> lines;
};

// "== 1 failed, 2 passed in 0.12s ==" or the bare "-q" form.
// Returns the text before " in <n>s".
std::optional<std::string> summary_body(const std::string& line) {
    static const std::regex framed(R"(^=+\s*(.*?)\s*=+$)");
    static const std::regex timed(R"(^(.*?)\s+in\s+[0-9]+(?:\.[0-9]+)?s\b.*$)");

    std::string t = trim(line);
    std::smatch m;
    std::string inner = t;
    if (std::regex_match(t, m, framed)) inner = m[1].str();

    std::smatch tm;
    if (!std::regex_match(inner, tm, timed)) return std::nullopt;
    std::string body = trim(tm[1].str());

    static const std::regex counts(R"(^(?:\d+\s+[A-Za-z]+)(?:\s*,\s*\d+\s+[A-Za-z]+)*$)");
    if (body == "no tests ran" || std::regex_match(body, counts)) return body;
    return std::nullopt;
}

void apply_counts(const std::string& body, TestResult& result) {
    static const std::regex item(R"((\d+)\s+([A-Za-z]+))");
    for (auto it = std::sregex_iterator(body.begin(), body.end(), item); it != std::sregex_iterator(); ++it) {
        auto count = to_int((*it)[1].str());
        if (!count) continue;
        int n = *count;
        std::string word = (*it)[2].str();
        if (word == "passed" || word == "xpassed") {
            result.passed += n;
        } else if (word == "failed" || word == "error" || word == "errors") {
            result.failed += n;
        } else if (word == "skipped" || word == "xfailed") {
            result.skipped += n;
        }
        // deselected, warning(s), rerun: not test outcomes
    }
}

bool is_section_rule(const std::string& line) {
    static const std::regex rule(R"(^=+\s*.*?\s*=+$)");
    return std::regex_match(line, rule);
}

// Blocks of the FAILURES and ERRORS sections, in output order
std::vector<TraceBlock> collect_trace_blocks(const std::vector<std::string>& lines) {
    static const std::regex section_start(R"(^=+\s*(FAILURES|ERRORS)\s*=+$)");
    static const std::regex block_header(R"(^_{3,}\s*(.+?)\s*_{3,}$)");

    std::vector<TraceBlock> blocks;
    bool in_section = false;
    for (const auto& raw_line : lines) {
        std::string line = trim(raw_line);
        if (std::regex_match(line, section_start)) {
            in_section = true;
            continue;
        }
        if (in_section && is_section_rule(line)) {
            in_section = false;
            continue;
        }
        if (!in_section) continue;

        std::smatch m;
        if (std::regex_match(line, m, block_header)) {
            blocks.push_back({m[1].str(), {}});
            continue;
        }
        if (!blocks.empty()) blocks.back().lines.push_back(raw_line);
    }
    return blocks;
}

// "ERROR at setup of test_x" -> "test_x"; "ERROR collecting a.py" -> "a.py"
std::string block_key(const std::string& header) {
    for (const char* prefix : {"ERROR at setup of ", "ERROR at teardown of ", "ERROR collecting "}) {
        if (starts_with(header, prefix)) return header.substr(std::string(prefix).size());
    }
    return header;
}

const TraceBlock* find_block(const std::vector<TraceBlock>& blocks, const std::string& file,
                             const std::string& name) {
    std::string dotted = name;
    size_t pos;
    while ((pos = dotted.find("::")) != std::string::npos) dotted.replace(pos, 2, ".");
    std::string last = name;
    if ((pos = name.rfind("::")) != std::string::npos) last = name.substr(pos + 2);

    for (const auto& b : blocks) {
        std::string key = block_key(b.header);
        if (key == dotted || key == name || (!name.empty() && key == last) ||
            (name.empty() && key == file)) {
            return &b;
        }
    }
    return nullptr;
}

std::optional<int> line_in_trace(const std::string& trace, const std::string& file) {
    if (file.empty()) return std::nullopt;
    std::optional<int> found;
    size_t pos = 0;
    while ((pos = trace.find(file + ":", pos)) != std::string::npos) {
        size_t digits = pos + file.size() + 1;
        size_t end = digits;
        while (end < trace.size() && std::isdigit(static_cast<unsigned char>(trace[end]))) ++end;
        if (end > digits) found = to_int(trace.substr(digits, end - digits));
        pos = end;
    }
    return found;
}

std::string first_error_line(const std::vector<std::string>& lines) {
    for (const auto& l : lines) {
        std::string t = trim(l);
        if (t.size() > 1 && t[0] == 'E' && std::isspace(static_cast<unsigned char>(t[1]))) {
            return trim(t.substr(1));
        }
    }
    return "";
}

TestFailure make_failure(const std::string& file, const std::string& name, const std::string& message,
                         const TraceBlock* block) {
    TestFailure f;
    f.test_name = name.empty() ? file : name;
    if (!file.empty()) f.file_path = file;
    f.error_message = message;

    if (block) {
        auto lines = trim_block(block->lines);
        if (!lines.empty()) {
            f.stack_trace = join_lines(lines, 0, lines.size());
            f.line_number = line_in_trace(*f.stack_trace, file);
            if (f.error_message.empty()) f.error_message = first_error_line(lines);
        }
    }
    if (f.error_message.empty()) f.error_message = "Test failed";
    return f;
}

} // namespace

TestResult parse_pytest(const RawOutput& raw) {
    TestResult result = begin_result(raw);
    auto lines = split_lines(strip_ansi(raw.text));

    // Last summary wins (plugins may echo earlier partial ones)
    std::optional<std::string> body;
    for (const auto& line : lines) {
        if (auto b = summary_body(line)) body = b;
    }
    if (body) apply_counts(*body, result);

    auto blocks = collect_trace_blocks(lines);

    static const std::regex short_line(R"(^(FAILED|ERROR)\s+(\S+)(?:\s+-\s+(.*))?$)");
    bool have_short_summary = false;
    for (const auto& raw_line : lines) {
        std::string line = trim(raw_line);
        std::smatch m;
        if (!std::regex_match(line, m, short_line)) continue;
        have_short_summary = true;

        std::string node_id = m[2].str();
        std::string file = node_id;
        std::string name;
        auto sep = node_id.find("::");
        if (sep != std::string::npos) {
            file = node_id.substr(0, sep);
            name = node_id.substr(sep + 2);
        }
        std::string message = m[3].matched ? trim(m[3].str()) : "";
        result.failures.push_back(make_failure(file, name, message, find_block(blocks, file, name)));
    }

    // Without -rfE the summary section is absent: fall back to trace headers
    if (!have_short_summary) {
        for (const auto& b : blocks) {
            std::string key = block_key(b.header);
            result.failures.push_back(make_failure("", key, "", &b));
        }
    }

    if (result.failures.size() > 0 && body && result.failed == 0 && result.passed == 0 &&
        result.skipped == 0) {
        // "no tests ran" alongside collection errors
        result.failed = static_cast<int>(result.failures.size());
    }

    finish_result(result, body.has_value());
    return result;
}

} // namespace fcorr::parsers
