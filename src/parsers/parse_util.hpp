#pragma once

#include "fcorr/parsers.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fcorr::parsers::detail {

std::vector<std::string> split_lines(const std::string& text);

std::string trim(const std::string& s);

std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end);

bool starts_with(const std::string& s, const std::string& prefix);

bool ends_with(const std::string& s, const std::string& suffix);

std::optional<int> to_int(const std::string& s);

// Drop leading and trailing blank lines of a block
std::vector<std::string> trim_block(std::vector<std::string> lines);

// Start a result from the raw output (raw text, exit code, duration, timeout)
TestResult begin_result(const RawOutput& raw);

/**
 * Settle condition, success and the count invariant.
 *
 * summary_found == false means no recognizable summary: counts are zeroed
 * and the result is marked unparsed.
 */
void finish_result(TestResult& result, bool summary_found);

} // namespace fcorr::parsers::detail
