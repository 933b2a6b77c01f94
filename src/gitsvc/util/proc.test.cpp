#include "./proc.hpp"

#include <gitsvc/util/string.hpp>
#include <gitsvc/util/temp.hpp>

#include <catch2/catch.hpp>

#include <system_error>

TEST_CASE("Quote command lines") {
    CHECK(gitsvc::quote_argument("simple") == "simple");
    CHECK(gitsvc::quote_argument("remote.origin.url") == "remote.origin.url");
    CHECK(gitsvc::quote_argument("@{u}") == "\"@{u}\"");
    CHECK(gitsvc::quote_argument("with space") == "\"with space\"");
    CHECK(gitsvc::quote_argument("") == "\"\"");
    CHECK(gitsvc::quote_command(std::vector<std::string>{"git", "config", "--get"})
          == "git config --get");
}

TEST_CASE("Capture stdout and stderr separately") {
    auto res = gitsvc::run_proc({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    CHECK_FALSE(res.okay());
    CHECK(res.retc == 3);
    CHECK(gitsvc::trim(res.stdout_output) == "out");
    CHECK(gitsvc::trim(res.stderr_output) == "err");
}

TEST_CASE("Run in a working directory") {
    auto tdir = gitsvc::temporary_dir::create();
    auto res  = gitsvc::run_proc(gitsvc::proc_options{
        .command = {"sh", "-c", "pwd -P"},
        .cwd     = tdir.path(),
    });
    CHECK(res.okay());
    CHECK(gitsvc::trim(res.stdout_output) == gitsvc::fs::canonical(tdir.path()).string());
}

TEST_CASE("A missing executable cannot be started") {
    try {
        gitsvc::run_proc({"gitsvc-this-program-does-not-exist"});
        FAIL("Spawning a non-existent program should throw");
    } catch (const std::system_error& e) {
        CHECK(e.code() == std::errc::no_such_file_or_directory);
    }
}

TEST_CASE("A missing working directory cannot be entered") {
    auto tdir = gitsvc::temporary_dir::create();
    CHECK_THROWS_AS(gitsvc::run_proc(gitsvc::proc_options{
                        .command = {"sh", "-c", "true"},
                        .cwd     = tdir.path() / "missing",
                    }),
                    std::system_error);
}

TEST_CASE("A subprocess holds no pipes except its own stdout and stderr") {
    // `ls -l` prints each descriptor of the shell as "... <fd> -> <target>"
    auto res = gitsvc::run_proc({"sh", "-c", "ls -l /proc/$$/fd"});
    REQUIRE(res.okay());
    for (auto line : gitsvc::split_nonempty(res.stdout_output, '\n')) {
        auto arrow = line.find(" -> pipe:");
        if (arrow == line.npos) {
            continue;
        }
        auto fd = line.substr(0, arrow);
        fd      = fd.substr(fd.rfind(' ') + 1);
        INFO("Inherited descriptor: " << line);
        CHECK((fd == "1" || fd == "2"));
    }
}
