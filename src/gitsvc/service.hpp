#pragma once

#include <gitsvc/error/result.hpp>
#include <gitsvc/util/fs.hpp>

#include <fmt/core.h>

#include <concepts>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace gitsvc {

/**
 * @brief The repository coordinates common to every hosting service.
 *
 * `user` and `repo` are never empty in a service produced by classify_remote().
 */
struct repo_coords {
    std::string                user;
    std::string                repo;
    std::optional<std::string> branch;

    bool operator==(const repo_coords&) const noexcept = default;
};

/// github.com
struct github : repo_coords {};
/// A self-hosted GitHub (github.<something>)
struct github_enterprise : repo_coords {};
/// gitlab.com, or a self-hosted GitLab (gitlab.<something>)
struct gitlab : repo_coords {};
/// bitbucket.org
struct bitbucket : repo_coords {};

enum class service_kind {
    github,
    github_enterprise,
    gitlab,
    bitbucket,
};

/**
 * @brief A hosting service, and the user/repo/branch on that service.
 */
class git_service {
    using variant_type = std::variant<github, github_enterprise, gitlab, bitbucket>;

    variant_type _var;

    const repo_coords& _coords() const noexcept {
        return std::visit([](const repo_coords& c) -> const repo_coords& { return c; }, _var);
    }

public:
    template <typename T>
        requires std::constructible_from<variant_type, T&&>
    git_service(T&& svc) noexcept(std::is_nothrow_constructible_v<variant_type, T&&>)
        : _var(std::forward<T>(svc)) {}

    const std::string&                user() const noexcept { return _coords().user; }
    const std::string&                repo() const noexcept { return _coords().repo; }
    const std::optional<std::string>& branch() const noexcept { return _coords().branch; }

    service_kind kind() const noexcept { return static_cast<service_kind>(_var.index()); }

    /**
     * @brief The human-readable name of the service, e.g. "GitHub Enterprise"
     */
    std::string_view name() const noexcept;

    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(_var);
    }

    template <typename T>
    const T& as() const& {
        return std::get<T>(_var);
    }

    decltype(auto) visit(auto&& func) const { return std::visit(func, _var); }

    bool operator==(const git_service&) const noexcept = default;
};

std::string_view name_of(service_kind) noexcept;

std::ostream& operator<<(std::ostream&, const git_service&);

/**
 * @brief Classify a Git remote URL as one of the supported hosting services.
 *
 * A trailing ".git" is removed before the URL is parsed. The first two segments of the URL path
 * are the user and the repository, and `branch` is passed through unmodified.
 *
 * Fails with errc::broken_url if the URL does not parse or has no host, and with
 * errc::cannot_detect if the host is an IP address, the path is too short, or the host is not a
 * known service.
 */
[[nodiscard]] result<git_service> classify_remote(std::string_view           remote_url,
                                                  std::optional<std::string> branch);

/**
 * @brief Detect the hosting service of the repository containing `path`, using the default Git
 * command (see config::default_git_command()).
 */
[[nodiscard]] result<git_service> detect(path_ref path);

/**
 * @brief Detect the hosting service of the repository containing `path`, using the given Git
 * executable.
 */
[[nodiscard]] result<git_service> detect_with_command(path_ref path, std::string git_command);

}  // namespace gitsvc

template <>
struct fmt::formatter<gitsvc::git_service> : fmt::formatter<std::string_view> {
    auto format(const gitsvc::git_service& svc, format_context& ctx) const
        -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "{} {}/{}", svc.name(), svc.user(), svc.repo());
        if (svc.branch()) {
            out = fmt::format_to(out, " (branch {})", *svc.branch());
        }
        return out;
    }
};
