#include "parse_util.hpp"

#include <cctype>
#include <cstdlib>

namespace fcorr::parsers {

std::string strip_ansi(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\x1b') {
            ++i;
            if (i < text.size() && text[i] == '[') {
                // CSI: parameters and intermediates up to a final byte in @..~
                ++i;
                while (i < text.size() && !(text[i] >= '@' && text[i] <= '~')) ++i;
                if (i < text.size()) ++i;
            } else if (i < text.size() && text[i] == ']') {
                // OSC: terminated by BEL or ESC backslash
                ++i;
                while (i < text.size() && text[i] != '\x07' &&
                       !(text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '\\')) {
                    ++i;
                }
                if (i < text.size()) i += text[i] == '\x07' ? 1 : 2;
            } else if (i < text.size()) {
                ++i;
            }
            continue;
        }
        if (c == '\r') {
            ++i;
            continue;
        }
        out += c;
        ++i;
    }
    return out;
}

namespace detail {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < lines.size(); ++i) {
        if (i > begin) out += '\n';
        out += lines[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<int> to_int(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (t.size() > 9) return std::nullopt;
    return std::atoi(t.c_str());
}

std::vector<std::string> trim_block(std::vector<std::string> lines) {
    while (!lines.empty() && trim(lines.back()).empty()) lines.pop_back();
    size_t first = 0;
    while (first < lines.size() && trim(lines[first]).empty()) ++first;
    lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));
    return lines;
}

TestResult begin_result(const RawOutput& raw) {
    TestResult result;
    result.raw_output = raw.text;
    result.exit_code = raw.exit_code;
    result.duration_ms = raw.duration_ms;
    return result;
}

void finish_result(TestResult& result, bool summary_found) {
    bool build_failed = result.condition == TestCondition::BuildFailed;

    if (!summary_found) {
        result.total = result.passed = result.failed = result.skipped = 0;
        result.success = false;
        if (!build_failed) {
            result.condition = TestCondition::UnparsedOutput;
            if (!result.error) result.error = "no recognizable test summary in output";
        }
        return;
    }

    int sum = result.passed + result.failed + result.skipped;
    if (result.total == 0) {
        result.total = sum;
    } else if (sum < result.total) {
        result.skipped += result.total - sum;
    } else if (sum > result.total) {
        result.total = sum;
    }

    if (result.total == 0) {
        result.success = false;
        if (!build_failed) {
            result.condition = TestCondition::NoTestsFound;
            if (!result.error) result.error = "no tests found";
        }
        return;
    }

    if (!build_failed) result.condition = TestCondition::Completed;
    result.success = result.condition == TestCondition::Completed && result.failed == 0;
}

} // namespace detail

} // namespace fcorr::parsers
