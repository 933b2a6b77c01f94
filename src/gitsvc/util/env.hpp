#pragma once

#include <optional>
#include <string>

namespace gitsvc {

std::optional<std::string> getenv(const std::string& env) noexcept;

/**
 * @brief Get an environment variable, treating an empty value the same as an unset one.
 */
std::optional<std::string> getenv_nonempty(const std::string& env) noexcept;

}  // namespace gitsvc
