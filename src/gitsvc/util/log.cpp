#include "./log.hpp"

#include <gitsvc/config.hpp>

#include <spdlog/spdlog.h>

using namespace gitsvc;

log::level log::current_log_level = config::default_log_level();

void log::init_logger() noexcept {
    spdlog::set_pattern("[gitsvc] [%^%-5l%$] %v");
    current_log_level = config::default_log_level();
}

std::optional<log::level> log::parse_level(std::string_view name) noexcept {
    if (name == "trace") {
        return level::trace;
    } else if (name == "debug") {
        return level::debug;
    } else if (name == "info") {
        return level::info;
    } else if (name == "warn") {
        return level::warn;
    } else if (name == "error") {
        return level::error;
    } else if (name == "critical") {
        return level::critical;
    } else if (name == "silent") {
        return level::silent;
    }
    return std::nullopt;
}

void log::log_print(log::level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        logger->set_level(spdlog::level::trace);
        return logger;
    }();

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        return spdlog::level::off;
    }();

    logger_inst->log(lvl, "{}", msg);
}
