#pragma once

#include <gitsvc/error/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gitsvc {

/**
 * @brief The syntactic form of a URL's host component
 */
enum class host_kind {
    none,
    domain,
    ipv4,
    ipv6,
};

struct parsed_url {
    std::string                scheme;
    std::optional<std::string> host;
    gitsvc::host_kind          kind = host_kind::none;
    std::string                path;
};

/**
 * @brief Determine whether a (non-empty) host string is an IP literal or a domain name.
 *
 * IPv6 literals are recognized by their enclosing brackets. IPv4 literals are four dot-separated
 * decimal octets. Everything else is a domain name.
 */
[[nodiscard]] host_kind classify_host(std::string_view host) noexcept;

/**
 * @brief Parse an absolute URL.
 *
 * On failure, the error carries errc::broken_url and an e_broken_url naming the input and the
 * parser's message. An empty host is reported as an absent host (kind == host_kind::none).
 */
[[nodiscard]] result<parsed_url> parse_remote_url(std::string_view url);

}  // namespace gitsvc
