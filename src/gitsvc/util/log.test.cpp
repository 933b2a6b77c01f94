#include "./log.hpp"

#include <gitsvc/config.hpp>

#include <catch2/catch.hpp>

#include <stdlib.h>

TEST_CASE("Parse log level names") {
    using gitsvc::log::level;
    CHECK(gitsvc::log::parse_level("trace") == level::trace);
    CHECK(gitsvc::log::parse_level("warn") == level::warn);
    CHECK(gitsvc::log::parse_level("silent") == level::silent);
    CHECK_FALSE(gitsvc::log::parse_level("WARN").has_value());
    CHECK_FALSE(gitsvc::log::parse_level("").has_value());
}

// Run by its own CTest entry with GITSVC_LOG_LEVEL=debug, before anything else touches the level
TEST_CASE("The initial log level is taken from the environment", "[.][log-env]") {
    CHECK(gitsvc::log::current_log_level == gitsvc::config::default_log_level());
    CHECK(gitsvc::log::current_log_level == gitsvc::log::level::debug);
}

TEST_CASE("init_logger() re-reads the log level from the environment") {
    using gitsvc::log::level;
    auto prev = gitsvc::log::current_log_level;

    ::setenv("GITSVC_LOG_LEVEL", "trace", 1);
    gitsvc::log::init_logger();
    CHECK(gitsvc::log::current_log_level == level::trace);
    CHECK(gitsvc::log::level_enabled(level::trace));

    ::setenv("GITSVC_LOG_LEVEL", "silent", 1);
    gitsvc::log::init_logger();
    CHECK_FALSE(gitsvc::log::level_enabled(level::critical));

    ::unsetenv("GITSVC_LOG_LEVEL");
    gitsvc::log::current_log_level = prev;
}
