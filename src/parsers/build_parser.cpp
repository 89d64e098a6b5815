#include "parse_util.hpp"

#include <cstddef>
#include <regex>
#include <utility>

namespace fcorr::parsers {

using namespace detail;

namespace {

const std::regex kTsError(R"(error TS\d+: (.+))");
const std::regex kTsWarning(R"(warning TS\d+: (.+))");

} // namespace

BuildDiagnostics parse_build_output(const std::string& text) {
    BuildDiagnostics diag;
    auto lines = split_lines(strip_ansi(text));

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        std::smatch m;

        if (std::regex_search(line, m, kTsError)) {
            diag.errors.push_back(trim(m[1].str()));
        } else if (std::regex_search(line, m, kTsWarning)) {
            diag.warnings.push_back(trim(m[1].str()));
        } else if (starts_with(line, "Error: ") || starts_with(line, "ERROR: ")) {
            diag.errors.push_back(trim(line.substr(7)));
        } else if (starts_with(line, "Warning: ") || starts_with(line, "WARNING: ")) {
            diag.warnings.push_back(trim(line.substr(9)));
        } else if (starts_with(line, "Failed to compile.")) {
            // Next.js style: heading, optional blank line, then a block up to the next blank line
            size_t end = i + 1;
            if (end < lines.size() && trim(lines[end]).empty()) ++end;
            while (end < lines.size() && !trim(lines[end]).empty()) ++end;
            std::vector<std::string> block(lines.begin() + static_cast<std::ptrdiff_t>(i),
                                           lines.begin() + static_cast<std::ptrdiff_t>(end));
            block = trim_block(std::move(block));
            diag.errors.push_back(join_lines(block, 0, block.size()));
            i = end - 1;
        }
    }
    return diag;
}

} // namespace fcorr::parsers
