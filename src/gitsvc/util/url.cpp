#include "./url.hpp"

#include <gitsvc/error/errors.hpp>
#include <gitsvc/util/string.hpp>

#include <neo/url.hpp>

#include <algorithm>
#include <cctype>

using namespace gitsvc;

namespace {

bool is_decimal_octet(std::string_view s) noexcept {
    if (s.empty() || s.size() > 3) {
        return false;
    }
    if (!std::all_of(s.begin(), s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        })) {
        return false;
    }
    int value = 0;
    for (char c : s) {
        value = value * 10 + (c - '0');
    }
    return value <= 255;
}

}  // namespace

host_kind gitsvc::classify_host(std::string_view host) noexcept {
    if (host.empty()) {
        return host_kind::none;
    }
    if (host.front() == '[' && host.back() == ']') {
        return host_kind::ipv6;
    }
    auto parts = split_nonempty(host, '.');
    if (parts.size() == 4 && std::count(host.begin(), host.end(), '.') == 3
        && std::all_of(parts.begin(), parts.end(), is_decimal_octet)) {
        return host_kind::ipv4;
    }
    return host_kind::domain;
}

result<parsed_url> gitsvc::parse_remote_url(std::string_view sv) {
    neo::url url;
    try {
        url = neo::url::parse(sv);
    } catch (const neo::url_validation_error& e) {
        return new_error(errc::broken_url, e_broken_url{std::string(sv), e.what()});
    }

    parsed_url ret;
    ret.scheme = url.scheme;
    ret.path   = url.path;
    if (url.host && !url.host->empty()) {
        ret.host      = *url.host;
        ret.kind      = classify_host(*url.host);
    }
    return ret;
}
