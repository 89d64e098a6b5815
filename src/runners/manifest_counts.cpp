#include "fcorr/runners.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <sstream>

namespace fcorr {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_comment(const std::string& line) {
    auto hash = line.find('#');
    return hash == std::string::npos ? line : line.substr(0, hash);
}

// Keys ("name = ...") inside any of the given TOML tables
int count_table_keys(const std::string& text, const std::set<std::string>& tables,
                     const std::set<std::string>& ignored_keys = {}) {
    static const std::regex header(R"(^\[\s*([^\]]+?)\s*\]$)");
    static const std::regex key(R"(^([A-Za-z0-9_.\-"']+)\s*=.*$)");

    std::istringstream in(text);
    std::string line;
    bool inside = false;
    int count = 0;
    while (std::getline(in, line)) {
        std::string t = trim(strip_comment(line));
        if (t.empty()) continue;
        std::smatch m;
        if (t[0] == '[') {
            inside = std::regex_match(t, m, header) && tables.count(m[1].str()) > 0;
            continue;
        }
        if (!inside || !std::regex_match(t, m, key)) continue;
        std::string name = m[1].str();
        name.erase(std::remove(name.begin(), name.end(), '"'), name.end());
        name.erase(std::remove(name.begin(), name.end(), '\''), name.end());
        if (!ignored_keys.count(name)) count++;
    }
    return count;
}

} // namespace

bool has_manifest_content(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(strip_comment(line)).empty()) return true;
    }
    return false;
}

int count_requirement_lines(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        std::string t = trim(strip_comment(line));
        if (t.empty()) continue;
        // Editable installs are packages; -r, -c and index options are not
        if (t[0] == '-' && t.rfind("-e ", 0) != 0 && t.rfind("--editable", 0) != 0) continue;
        count++;
    }
    return count;
}

int count_pyproject_dependencies(const std::string& text) {
    int count = count_table_keys(text,
                                 {"tool.poetry.dependencies", "tool.poetry.dev-dependencies",
                                  "tool.poetry.group.dev.dependencies"},
                                 {"python"});

    // [project] dependencies = ["a>=1", "b[extra]"], possibly spanning lines.
    // Brackets and '#' inside quoted entries belong to the entry.
    static const std::regex opening(R"(^dependencies\s*=\s*\[)");
    std::istringstream in(text);
    std::string line;
    bool in_project = false;
    bool in_array = false;
    while (std::getline(in, line)) {
        char quote = 0;
        std::string segment;
        if (in_array) {
            segment = line;
        } else {
            std::string t = trim(line);
            if (!t.empty() && t[0] == '[') {
                in_project = trim(strip_comment(t)) == "[project]";
                continue;
            }
            std::smatch m;
            if (!in_project || !std::regex_search(t, m, opening)) continue;
            segment = m.suffix().str();
            in_array = true;
        }

        for (char c : segment) {
            if (quote) {
                if (c == quote) {
                    quote = 0;
                    count++;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#') {
                break;
            } else if (c == ']') {
                in_array = false;
                break;
            }
        }
    }
    return count;
}

int count_pipfile_packages(const std::string& text) {
    return count_table_keys(text, {"packages", "dev-packages"});
}

int count_go_requires(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    bool in_block = false;
    int count = 0;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        auto comment = t.find("//");
        if (comment != std::string::npos) t = trim(t.substr(0, comment));
        if (t.empty()) continue;
        if (in_block) {
            if (t == ")") {
                in_block = false;
            } else {
                count++;
            }
        } else if (t == "require (") {
            in_block = true;
        } else if (t.rfind("require ", 0) == 0) {
            count++;
        }
    }
    return count;
}

int count_cargo_dependencies(const std::string& text) {
    return count_table_keys(text, {"dependencies", "dev-dependencies", "build-dependencies"});
}

} // namespace fcorr
