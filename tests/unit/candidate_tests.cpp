#include <doctest/doctest.h>
#include <fcorr/candidate.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace fcorr;
using fcorr::test::TempTestDir;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("glob_match wildcards") {
    CHECK(glob_match("test_*.py", "test_app.py"));
    CHECK(glob_match("*_test.py", "app_test.py"));
    CHECK_FALSE(glob_match("test_*.py", "app_test.py"));
    CHECK(glob_match("*.test.ts", "math.test.ts"));
    CHECK_FALSE(glob_match("*.test.ts", "math.test.tsx"));
    CHECK(glob_match("?.rs", "a.rs"));
    CHECK_FALSE(glob_match("?.rs", "ab.rs"));
    CHECK(glob_match("*", ""));
    CHECK(glob_match("conftest.py", "conftest.py"));
}

TEST_CASE("default exclusions cover dependency and build directories") {
    const auto& excluded = default_excluded_directories();
    for (const char* dir : {"node_modules", "venv", ".venv", "site-packages", "__pycache__", ".git", "dist",
                            "target", ".fcorr-venv"}) {
        CHECK(excluded.count(dir) == 1);
    }
    CHECK(excluded.count("src") == 0);
    CHECK(excluded.count("tests") == 0);
}

TEST_CASE("CandidateProject file queries") {
    TempTestDir tmp;
    tmp.write("requirements.txt", "requests\n");
    tmp.write("src/app.py", "x = 1\n");
    tmp.mkdir("tests");

    CandidateProject c(tmp.path());
    CHECK(c.valid());
    CHECK(c.has_file("requirements.txt"));
    CHECK_FALSE(c.has_file("src"));
    CHECK(c.has_directory("src"));
    CHECK(c.has_directory("tests"));
    CHECK_FALSE(c.has_directory("requirements.txt"));

    auto text = c.read_file("requirements.txt");
    REQUIRE(text.has_value());
    CHECK(*text == "requests\n");
    CHECK_FALSE(c.read_file("missing.txt").has_value());
}

TEST_CASE("CandidateProject on a missing directory") {
    CandidateProject c("/nonexistent/fcorr/candidate");
    CHECK_FALSE(c.valid());
    CHECK(c.files().empty());
}

TEST_CASE("listing skips vendored directories and is sorted") {
    TempTestDir tmp;
    tmp.write("tests/test_b.py", "");
    tmp.write("tests/test_a.py", "");
    tmp.write("venv/lib/site-packages/pkg/test_vendored.py", "");
    tmp.write("node_modules/lib/index.test.js", "");
    tmp.write("app/.venv/test_hidden.py", "");

    CandidateProject c(tmp.path());
    const auto& files = c.files();
    CHECK(files.size() == 2);
    CHECK(files[0] == "tests/test_a.py");
    CHECK(files[1] == "tests/test_b.py");

    auto found = c.find_files({"test_*.py"});
    CHECK(found.size() == 2);
    CHECK_FALSE(contains(found, "venv/lib/site-packages/pkg/test_vendored.py"));
}

TEST_CASE("find_files honours extra exclusions") {
    TempTestDir tmp;
    tmp.write("tests/test_a.py", "");
    tmp.write("fixtures/test_fixture.py", "");

    CandidateProject c(tmp.path());
    CHECK(c.find_files({"test_*.py"}).size() == 2);

    auto found = c.find_files({"test_*.py"}, {"fixtures"});
    REQUIRE(found.size() == 1);
    CHECK(found[0] == "tests/test_a.py");
}

TEST_CASE("files_under restricts to a directory") {
    TempTestDir tmp;
    tmp.write("tests/it.rs", "");
    tmp.write("tests_extra/other.rs", "");
    tmp.write("src/lib.rs", "");

    CandidateProject c(tmp.path());
    auto under = c.files_under("tests");
    REQUIRE(under.size() == 1);
    CHECK(under[0] == "tests/it.rs");
}
