#pragma once

#include <gitsvc/util/log.hpp>

#include <string>

namespace gitsvc::config {

namespace defaults {

/**
 * @brief The Git executable used by gitsvc::detect(). This is the value of the GITSVC_GIT
 * environment variable if it is set and non-empty, otherwise "git".
 */
std::string default_git_command();

/**
 * @brief The initial log level. Taken from the GITSVC_LOG_LEVEL environment variable if it names
 * a valid level, otherwise `warn`.
 */
log::level default_log_level() noexcept;

}  // namespace defaults

using namespace defaults;

}  // namespace gitsvc::config
