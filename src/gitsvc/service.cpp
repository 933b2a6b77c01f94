#include "./service.hpp"

#include <gitsvc/config.hpp>
#include <gitsvc/error/errors.hpp>
#include <gitsvc/error/on_error.hpp>
#include <gitsvc/git.hpp>
#include <gitsvc/util/log.hpp>
#include <gitsvc/util/string.hpp>
#include <gitsvc/util/url.hpp>

#include <boost/leaf.hpp>
#include <fmt/core.h>

#include <ostream>

using namespace gitsvc;

std::string_view gitsvc::name_of(service_kind k) noexcept {
    switch (k) {
    case service_kind::github:
        return "GitHub";
    case service_kind::github_enterprise:
        return "GitHub Enterprise";
    case service_kind::gitlab:
        return "GitLab";
    case service_kind::bitbucket:
        return "Bitbucket";
    }
    return "unknown";
}

std::string_view git_service::name() const noexcept { return name_of(kind()); }

std::ostream& gitsvc::operator<<(std::ostream& out, const git_service& svc) {
    return out << fmt::format("{}", svc);
}

result<git_service> gitsvc::classify_remote(std::string_view           remote_url_,
                                            std::optional<std::string> branch) {
    auto remote_url = strip_suffix(remote_url_, ".git");
    GITSVC_E_SCOPE(e_url_string{std::string(remote_url)});

    BOOST_LEAF_AUTO(url, parse_remote_url(remote_url));

    if (url.kind == host_kind::none) {
        return new_error(errc::broken_url,
                         e_broken_url{std::string(remote_url), "No host in URL"});
    }
    if (url.kind != host_kind::domain) {
        return new_error(errc::cannot_detect,
                         e_cannot_detect{
                             fmt::format("Domain name must be contained in URL {}", remote_url)});
    }
    const auto& host = *url.host;

    auto segments = split_nonempty(url.path, '/');
    if (segments.size() < 2) {
        return new_error(errc::cannot_detect,
                         e_cannot_detect{fmt::format("Path does not represent user/repo in URL {}",
                                                     remote_url)});
    }
    repo_coords coords{
        .user   = std::string(segments[0]),
        .repo   = std::string(segments[1]),
        .branch = std::move(branch),
    };
    gitsvc_log(trace, "Classifying host '{}' of [{}]", host, remote_url);

    if (host == "github.com") {
        return git_service{github{std::move(coords)}};
    } else if (host == "gitlab.com") {
        return git_service{gitlab{std::move(coords)}};
    } else if (host == "bitbucket.org") {
        return git_service{bitbucket{std::move(coords)}};
    } else if (host.starts_with("github.")) {
        return git_service{github_enterprise{std::move(coords)}};
    } else if (host.starts_with("gitlab.")) {
        return git_service{gitlab{std::move(coords)}};
    }
    return new_error(errc::cannot_detect,
                     e_cannot_detect{fmt::format("No service detected from URL {}", remote_url)});
}

result<git_service> gitsvc::detect_with_command(path_ref path, std::string git_command) {
    BOOST_LEAF_AUTO(remote, resolve_remote(path, std::move(git_command)));
    gitsvc_log(debug,
               "Remote of [{}] is [{}] (branch: {})",
               path.string(),
               remote.url,
               remote.branch.value_or("<none>"));
    return classify_remote(remote.url, std::move(remote.branch));
}

result<git_service> gitsvc::detect(path_ref path) {
    return detect_with_command(path, config::default_git_command());
}
