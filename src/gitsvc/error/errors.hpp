#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace gitsvc {

/**
 * @brief The kinds of failure that can come out of service detection. Every failure carries
 * exactly one of these along with the matching e_* object declared below.
 */
enum class errc {
    /// The Git executable could not be started at all. Carries e_command_cannot_run.
    command_cannot_run = 1,
    /// Git ran, but a required query exited unsuccessfully. Carries e_git_command_failed.
    git_command_failed,
    /// The remote URL could not be parsed, or has no host. Carries e_broken_url.
    broken_url,
    /// The URL is fine, but does not name a supported service. Carries e_cannot_detect.
    cannot_detect,
};

std::string_view name_of(errc) noexcept;

struct e_command_cannot_run {
    /// The OS-level description of the failure
    std::string value;

    std::string to_string() const;
};

struct e_git_command_failed {
    /// Trimmed stderr of the failed command
    std::string stderr_output;
    /// The arguments that were passed to Git
    std::vector<std::string> args;

    std::string to_string() const;
};

struct e_broken_url {
    std::string url;
    std::string message;

    std::string to_string() const;
};

struct e_cannot_detect {
    std::string reason;

    std::string to_string() const;
};

/// Context: The remote URL being classified
struct e_url_string {
    std::string value;
};

/// Context: The directory in which Git was queried
struct e_repo_dir {
    std::filesystem::path value;
};

std::ostream& operator<<(std::ostream&, errc);
std::ostream& operator<<(std::ostream&, const e_command_cannot_run&);
std::ostream& operator<<(std::ostream&, const e_git_command_failed&);
std::ostream& operator<<(std::ostream&, const e_broken_url&);
std::ostream& operator<<(std::ostream&, const e_cannot_detect&);

}  // namespace gitsvc
