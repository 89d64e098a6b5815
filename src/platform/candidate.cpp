#include "fcorr/candidate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fcorr {

namespace stdfs = std::filesystem;

namespace {

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string file_name_of(const std::string& relative) {
    auto pos = relative.rfind('/');
    return pos == std::string::npos ? relative : relative.substr(pos + 1);
}

bool has_excluded_component(const std::string& relative, const std::set<std::string>& excluded) {
    if (excluded.empty()) return false;
    size_t start = 0;
    while (true) {
        size_t end = relative.find('/', start);
        if (end == std::string::npos) return false;  // last component is the file name
        if (excluded.count(relative.substr(start, end - start))) return true;
        start = end + 1;
    }
}

} // namespace

const std::set<std::string>& default_excluded_directories() {
    static const std::set<std::string> dirs = {
        // javascript
        "node_modules", ".next", ".nuxt", ".cache", "coverage", "dist", "build",
        // python
        "venv", ".venv", "env", "virtualenv", ".tox", ".nox", "__pycache__",
        ".eggs", "eggs", "site-packages", ".mypy_cache", ".pytest_cache", ".fcorr-venv",
        // go / rust
        "vendor", "target",
        // vcs
        ".git", ".hg", ".svn",
    };
    return dirs;
}

bool glob_match(const std::string& pattern, const std::string& name) {
    size_t p = 0, n = 0;
    size_t star = std::string::npos, mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

CandidateProject::CandidateProject(std::string root) : root_(std::move(root)) {}

bool CandidateProject::valid() const {
    std::error_code ec;
    return stdfs::is_directory(root_, ec);
}

bool CandidateProject::has_file(const std::string& relative) const {
    std::error_code ec;
    return stdfs::is_regular_file(path_of(relative), ec);
}

bool CandidateProject::has_directory(const std::string& relative) const {
    std::error_code ec;
    return stdfs::is_directory(path_of(relative), ec);
}

std::string CandidateProject::path_of(const std::string& relative) const {
    if (relative.empty()) return root_;
    return to_portable_path((stdfs::path(root_) / relative).string());
}

std::optional<std::string> CandidateProject::read_file(const std::string& relative) const {
    std::ifstream file(path_of(relative), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

const std::vector<std::string>& CandidateProject::files() const {
    if (listing_) return *listing_;

    std::vector<std::string> out;
    const auto& excluded = default_excluded_directories();

    std::error_code ec;
    stdfs::recursive_directory_iterator it(root_, stdfs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::debug("cannot list {}: {}", root_, ec.message());
        listing_ = std::move(out);
        return *listing_;
    }

    for (auto end = stdfs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("listing error under {}: {}", root_, ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code entry_ec;

        if (entry.is_symlink(entry_ec)) {
            // Never follow links out of the candidate
            if (entry.is_directory(entry_ec)) it.disable_recursion_pending();
            continue;
        }
        if (entry.is_directory(entry_ec)) {
            if (excluded.count(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(entry_ec)) continue;

        auto rel = stdfs::relative(entry.path(), root_, entry_ec);
        if (entry_ec) continue;
        out.push_back(to_portable_path(rel.string()));
    }

    std::sort(out.begin(), out.end());
    listing_ = std::move(out);
    return *listing_;
}

std::vector<std::string> CandidateProject::find_files(const std::vector<std::string>& patterns,
                                                      const std::set<std::string>& extra_excluded) const {
    std::vector<std::string> result;
    for (const auto& rel : files()) {
        if (has_excluded_component(rel, extra_excluded)) continue;
        std::string name = file_name_of(rel);
        for (const auto& pattern : patterns) {
            if (glob_match(pattern, name)) {
                result.push_back(rel);
                break;
            }
        }
    }
    return result;
}

std::vector<std::string> CandidateProject::files_under(const std::string& relative_dir) const {
    std::string prefix = relative_dir;
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';

    std::vector<std::string> result;
    for (const auto& rel : files()) {
        if (rel.compare(0, prefix.size(), prefix) == 0) result.push_back(rel);
    }
    return result;
}

} // namespace fcorr
