#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> gitsvc::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}

std::optional<std::string> gitsvc::getenv_nonempty(const std::string& varname) noexcept {
    auto val = getenv(varname);
    if (val && val->empty()) {
        return std::nullopt;
    }
    return val;
}
