#include "./proc.hpp"

#include <gitsvc/util/string.hpp>

#include <algorithm>
#include <cctype>

using namespace gitsvc;

bool gitsvc::needs_quoting(std::string_view s) {
    std::string_view okay_chars = "@%-+=:,./|_";
    const bool       all_okay   = std::all_of(s.begin(), s.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c))
            || (okay_chars.find(c) != okay_chars.npos);
    });
    return s.empty() || !all_okay;
}

std::string gitsvc::quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    auto new_s = replace(s, "\\", "\\\\");
    new_s      = replace(new_s, "\"", "\\\"");
    return "\"" + new_s + "\"";
}
