#include "./fs.hpp"

#include <gitsvc/util/temp.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Repository directory of a path") {
    auto tdir = gitsvc::temporary_dir::create();
    auto file = tdir.path() / "README.md";
    gitsvc::write_file(file, "hello\n");

    // Files resolve to their parent
    CHECK(gitsvc::repository_dir_of(file) == tdir.path());
    // Directories are used directly
    CHECK(gitsvc::repository_dir_of(tdir.path()) == tdir.path());
    // Missing paths are passed through as-is
    CHECK(gitsvc::repository_dir_of(tdir.path() / "nope") == tdir.path() / "nope");
}
