#include "./config.hpp"

#include <gitsvc/util/env.hpp>

using namespace gitsvc;

std::string config::defaults::default_git_command() {
    return getenv_nonempty("GITSVC_GIT").value_or("git");
}

log::level config::defaults::default_log_level() noexcept {
    auto name = getenv("GITSVC_LOG_LEVEL");
    if (!name) {
        return log::level::warn;
    }
    return log::parse_level(*name).value_or(log::level::warn);
}
