#include "./git.hpp"

#include <gitsvc/error/errors.hpp>
#include <gitsvc/error/on_error.hpp>
#include <gitsvc/util/log.hpp>
#include <gitsvc/util/proc.hpp>
#include <gitsvc/util/string.hpp>

#include <boost/leaf.hpp>
#include <fmt/core.h>

#include <system_error>

using namespace gitsvc;
using namespace std::literals;

std::string gitsvc::scp_to_ssh_url(std::string url) {
    if (!url.starts_with("git@")) {
        return url;
    }
    // git@service.com:user/repo.git -> ssh://git@service.com:22/user/repo.git
    auto colon = url.find(':');
    if (colon != url.npos) {
        url.insert(colon + 1, "22/");
    }
    url.insert(0, "ssh://");
    gitsvc_log(trace, "Rewrote SCP-like remote as SSH URL [{}]", url);
    return url;
}

result<std::string> git_repo_query::run(std::vector<std::string> args) const {
    GITSVC_E_SCOPE(e_repo_dir{_dir});
    std::vector<std::string> command = {_command, "-C"s, _dir.string()};
    command.insert(command.end(), args.begin(), args.end());

    proc_result res;
    try {
        res = run_proc(proc_options{.command = std::move(command), .cwd = _dir});
    } catch (const std::system_error& e) {
        return new_error(errc::command_cannot_run, e_command_cannot_run{e.what()}, e.code());
    }

    if (!res.okay()) {
        return new_error(errc::git_command_failed,
                         e_git_command_failed{std::string(trim(res.stderr_output)),
                                              std::move(args)});
    }
    return std::string(trim(res.stdout_output));
}

result<std::string> git_repo_query::remote_url(std::string_view name) const {
    // `git remote get-url` only exists since Git 2.7, so read the config key instead
    BOOST_LEAF_AUTO(url, run({"config"s, "--get"s, fmt::format("remote.{}.url", name)}));
    return scp_to_ssh_url(std::move(url));
}

std::optional<std::string> git_repo_query::upstream_ref() const {
    return boost::leaf::try_handle_all(
        [&]() -> result<std::optional<std::string>> {
            BOOST_LEAF_AUTO(ref, run({"rev-parse"s, "--abbrev-ref"s, "--symbolic"s, "@{u}"s}));
            return std::optional<std::string>(std::move(ref));
        },
        [&](const e_git_command_failed& e) -> std::optional<std::string> {
            gitsvc_log(debug, "No upstream for HEAD in [{}]: {}", _dir.string(), e.to_string());
            return std::nullopt;
        },
        [&](const e_command_cannot_run& e) -> std::optional<std::string> {
            gitsvc_log(debug, "Failed to query upstream of HEAD: {}", e.to_string());
            return std::nullopt;
        },
        []() -> std::optional<std::string> { return std::nullopt; });
}

std::optional<std::string> git_repo_query::current_branch() const {
    return boost::leaf::try_handle_all(
        [&]() -> result<std::optional<std::string>> {
            BOOST_LEAF_AUTO(name, run({"rev-parse"s, "--abbrev-ref"s, "HEAD"s}));
            // Git prints "HEAD" when HEAD is detached
            if (name.empty() || name == "HEAD") {
                return std::optional<std::string>();
            }
            return std::optional<std::string>(std::move(name));
        },
        [&](const e_git_command_failed& e) -> std::optional<std::string> {
            gitsvc_log(debug,
                       "Cannot read current branch in [{}]: {}",
                       _dir.string(),
                       e.to_string());
            return std::nullopt;
        },
        []() -> std::optional<std::string> { return std::nullopt; });
}

result<remote_identity> git_repo_query::tracking_remote() const {
    std::string                remote_name;
    std::optional<std::string> branch;

    // The upstream is printed as '{remote-name}/{branch-name}'
    if (auto upstream = upstream_ref()) {
        auto [name, rest] = split_once(*upstream, '/');
        remote_name       = std::string(name);
        if (rest) {
            branch = std::string(*rest);
        }
    }

    if (!remote_name.empty()) {
        auto upstream_url = boost::leaf::try_handle_some(
            [&]() -> result<std::optional<std::string>> {
                BOOST_LEAF_AUTO(url, remote_url(remote_name));
                return std::optional<std::string>(std::move(url));
            },
            [&](boost::leaf::match<errc, errc::git_command_failed>,
                const boost::leaf::error_info& info) -> result<std::optional<std::string>> {
                if (remote_name == "origin") {
                    return info.error();
                }
                gitsvc_log(debug,
                           "Upstream names remote '{}', which has no URL. Falling back to 'origin'",
                           remote_name);
                return std::optional<std::string>();
            });
        BOOST_LEAF_CHECK(upstream_url);
        if (*upstream_url) {
            if (!branch) {
                branch = current_branch();
            }
            return remote_identity{std::move(**upstream_url), std::move(branch)};
        }
    } else {
        gitsvc_log(debug, "No upstream tracking information. Using remote 'origin'");
    }

    BOOST_LEAF_AUTO(url, remote_url("origin"));
    return remote_identity{std::move(url), current_branch()};
}

result<remote_identity> gitsvc::resolve_remote(path_ref location, std::string git_command) {
    git_repo_query git{repository_dir_of(location), std::move(git_command)};
    return git.tracking_remote();
}
