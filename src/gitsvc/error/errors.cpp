#include "./errors.hpp"

#include <fmt/format.h>

#include <iterator>
#include <ostream>

using namespace gitsvc;

std::string_view gitsvc::name_of(errc ec) noexcept {
    switch (ec) {
    case errc::command_cannot_run:
        return "command_cannot_run";
    case errc::git_command_failed:
        return "git_command_failed";
    case errc::broken_url:
        return "broken_url";
    case errc::cannot_detect:
        return "cannot_detect";
    }
    return "unknown";
}

std::string e_command_cannot_run::to_string() const {
    return fmt::format("{}: cannot run command", value);
}

std::string e_git_command_failed::to_string() const {
    fmt::memory_buffer out;
    auto               it = std::back_inserter(out);
    if (stderr_output.empty()) {
        fmt::format_to(it, "`git");
    } else {
        fmt::format_to(it, "{}: `git", stderr_output);
    }
    for (auto& arg : args) {
        fmt::format_to(it, " '{}'", arg);
    }
    fmt::format_to(it, "` exited with non-zero status");
    return fmt::to_string(out);
}

std::string e_broken_url::to_string() const {
    return fmt::format("Git URL {} is broken: {}", url, message);
}

std::string e_cannot_detect::to_string() const {
    return fmt::format("Cannot detect service: {}", reason);
}

std::ostream& gitsvc::operator<<(std::ostream& out, errc ec) { return out << name_of(ec); }

std::ostream& gitsvc::operator<<(std::ostream& out, const e_command_cannot_run& e) {
    return out << e.to_string();
}

std::ostream& gitsvc::operator<<(std::ostream& out, const e_git_command_failed& e) {
    return out << e.to_string();
}

std::ostream& gitsvc::operator<<(std::ostream& out, const e_broken_url& e) {
    return out << e.to_string();
}

std::ostream& gitsvc::operator<<(std::ostream& out, const e_cannot_detect& e) {
    return out << e.to_string();
}
