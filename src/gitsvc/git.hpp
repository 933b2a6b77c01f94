#pragma once

#include <gitsvc/error/result.hpp>
#include <gitsvc/util/fs.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitsvc {

/**
 * @brief The remote URL and branch that a working copy is tracking
 */
struct remote_identity {
    std::string                url;
    std::optional<std::string> branch;
};

/**
 * @brief Rewrite an SCP-like remote (git@host:owner/repo.git) as an explicit SSH URL
 * (ssh://git@host:22/owner/repo.git). Other URLs are returned unchanged.
 */
[[nodiscard]] std::string scp_to_ssh_url(std::string url);

/**
 * @brief Runs read-only Git queries against a single repository directory.
 *
 * Every query runs `<command> -C <dir> <args...>` with `<dir>` as the working directory. A
 * relative `dir` is made absolute against the current directory when the query is created.
 */
class git_repo_query {
    std::string _command;
    fs::path    _dir;

public:
    explicit git_repo_query(path_ref dir, std::string command = "git")
        : _command(std::move(command))
        , _dir(fs::absolute(dir)) {}

    path_ref           dir() const noexcept { return _dir; }
    const std::string& command() const noexcept { return _command; }

    /**
     * @brief Run Git with the given arguments and return its trimmed stdout.
     *
     * Fails with errc::command_cannot_run if Git could not be started, or with
     * errc::git_command_failed if it exited unsuccessfully.
     */
    [[nodiscard]] result<std::string> run(std::vector<std::string> args) const;

    /**
     * @brief Read `remote.<name>.url`, rewriting SCP-like syntax into an ssh:// URL.
     */
    [[nodiscard]] result<std::string> remote_url(std::string_view name) const;

    /**
     * @brief The upstream of HEAD as "<remote>/<branch>", or nullopt if there is none (detached
     * HEAD, no upstream configured) or Git could not tell us.
     */
    [[nodiscard]] std::optional<std::string> upstream_ref() const;

    /**
     * @brief The name of the branch that HEAD points to, or nullopt if HEAD is detached or Git
     * could not tell us.
     */
    [[nodiscard]] std::optional<std::string> current_branch() const;

    /**
     * @brief Determine the remote URL and branch to use for this repository.
     *
     * Uses the upstream of HEAD when there is one, otherwise the "origin" remote and the current
     * branch. Only the remote URL lookup can fail.
     */
    [[nodiscard]] result<remote_identity> tracking_remote() const;
};

/**
 * @brief Resolve the remote identity of the repository containing `location`.
 *
 * If `location` is a file, its directory is used.
 */
[[nodiscard]] result<remote_identity> resolve_remote(path_ref location, std::string git_command);

}  // namespace gitsvc
