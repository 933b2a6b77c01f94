#include "./string.hpp"

#include <catch2/catch.hpp>

using namespace gitsvc;

#define CHECK_SPLIT(str, ...)                                                                      \
    do {                                                                                           \
        INFO("Splitting string: '" << str << "'");                                                 \
        CHECK(split_nonempty(str, '/') == std::vector<std::string_view>(__VA_ARGS__));             \
    } while (0)

TEST_CASE("Trimming") {
    CHECK(trim("foo") == "foo");
    CHECK(trim("  foo  \n") == "foo");
    CHECK(trim("\tfoo bar\r\n") == "foo bar");
    CHECK(trim("") == "");
    CHECK(trim("   \n") == "");
}

TEST_CASE("Strip a suffix once") {
    CHECK(strip_suffix("repo.git", ".git") == "repo");
    CHECK(strip_suffix("repo.git.git", ".git") == "repo.git");
    CHECK(strip_suffix("repo.GIT", ".git") == "repo.GIT");
    CHECK(strip_suffix("repo", ".git") == "repo");
}

TEST_CASE("Split once") {
    auto [remote, branch] = split_once("origin/feature/thing", '/');
    CHECK(remote == "origin");
    REQUIRE(branch);
    CHECK(*branch == "feature/thing");

    auto [whole, none] = split_once("origin", '/');
    CHECK(whole == "origin");
    CHECK_FALSE(none);
}

TEST_CASE("Split dropping empty segments") {
    CHECK_SPLIT("/foo/bar", {"foo", "bar"});
    CHECK_SPLIT("//foo", {"foo"});
    CHECK_SPLIT("foo/", {"foo"});
    CHECK_SPLIT("/", {});
    CHECK_SPLIT("", {});
    CHECK_SPLIT("a//b///c/", {"a", "b", "c"});
}

TEST_CASE("Replace") {
    CHECK(replace("a\"b\"", "\"", "\\\"") == "a\\\"b\\\"");
    CHECK(replace("nothing", "x", "y") == "nothing");
}
