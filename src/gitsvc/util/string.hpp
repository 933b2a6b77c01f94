#pragma once

#include <cctype>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitsvc {

inline namespace string_utils {

inline std::string_view sview(std::string_view::const_iterator beg,
                              std::string_view::const_iterator end) {
    return std::string_view(&*beg, static_cast<std::size_t>(std::distance(beg, end)));
}

inline std::string_view trim(std::string_view s) {
    auto iter = s.begin();
    auto end  = s.end();
    while (iter != end && std::isspace(static_cast<unsigned char>(*iter))) {
        ++iter;
    }
    auto riter = s.rbegin();
    auto rend  = std::make_reverse_iterator(iter);
    while (riter != rend && std::isspace(static_cast<unsigned char>(*riter))) {
        ++riter;
    }
    if (iter == end) {
        return {};
    }
    return sview(iter, riter.base());
}

/**
 * @brief Remove one trailing occurrence of `suffix` from `s`, if present. Case-sensitive.
 */
inline std::string_view strip_suffix(std::string_view s, std::string_view suffix) {
    if (s.ends_with(suffix)) {
        s.remove_suffix(suffix.size());
    }
    return s;
}

/**
 * @brief Split at the first occurrence of `sep`. If `sep` does not occur, the second element is
 * nullopt and the first element is the whole string.
 */
inline std::pair<std::string_view, std::optional<std::string_view>>
split_once(std::string_view s, char sep) {
    auto pos = s.find(sep);
    if (pos == s.npos) {
        return {s, std::nullopt};
    }
    return {s.substr(0, pos), s.substr(pos + 1)};
}

/**
 * @brief Split on `sep`, dropping empty segments
 */
inline std::vector<std::string_view> split_nonempty(std::string_view str, char sep) {
    std::vector<std::string_view> ret;
    while (!str.empty()) {
        auto [head, tail] = split_once(str, sep);
        if (!head.empty()) {
            ret.push_back(head);
        }
        if (!tail) {
            break;
        }
        str = *tail;
    }
    return ret;
}

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

}  // namespace string_utils

}  // namespace gitsvc
