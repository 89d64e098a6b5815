#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fcorr {

// ============================================================================
// Vendored Directory Exclusion
// ============================================================================

// Directory names that hold installed dependencies, caches or build output.
// Scans never descend into them.
const std::set<std::string>& default_excluded_directories();

// Shell-style match of a file name against a pattern ('*' and '?').
bool glob_match(const std::string& pattern, const std::string& name);

// ============================================================================
// Candidate Project
// ============================================================================

/**
 * Read-only view of a candidate directory.
 *
 * File contents are read on demand; the recursive listing is built once on
 * first use. Paths returned by listing functions are relative to root(),
 * with forward slashes, sorted.
 */
class CandidateProject {
public:
    explicit CandidateProject(std::string root);

    const std::string& root() const { return root_; }

    // True when root() exists and is a directory
    bool valid() const;

    bool has_file(const std::string& relative) const;
    bool has_directory(const std::string& relative) const;

    // Absolute (root-joined) path for a relative path
    std::string path_of(const std::string& relative) const;

    std::optional<std::string> read_file(const std::string& relative) const;

    // Every regular file outside default_excluded_directories()
    const std::vector<std::string>& files() const;

    // Files whose name matches any pattern, skipping `extra_excluded` too
    std::vector<std::string> find_files(const std::vector<std::string>& patterns,
                                        const std::set<std::string>& extra_excluded = {}) const;

    // Files under a relative directory (already filtered by exclusions)
    std::vector<std::string> files_under(const std::string& relative_dir) const;

private:
    std::string root_;
    mutable std::optional<std::vector<std::string>> listing_;
};

} // namespace fcorr
