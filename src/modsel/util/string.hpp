#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

inline namespace string_utils {

inline std::string_view sview(std::string_view::const_iterator beg,
                              std::string_view::const_iterator end) {
    return std::string_view(&*beg, static_cast<std::size_t>(std::distance(beg, end)));
}

inline std::string_view trim_view(std::string_view s) {
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
    auto new_end = riter.base();
    if (iter == new_end) {
        return {};
    }
    return sview(iter, new_end);
}

inline std::vector<std::string> split(std::string_view str, std::string_view sep) {
    std::vector<std::string>    ret;
    std::string_view::size_type prev_pos = 0;
    auto                        pos      = prev_pos;
    while ((pos = str.find(sep, prev_pos)) != str.npos) {
        ret.emplace_back(str.substr(prev_pos, pos - prev_pos));
        prev_pos = pos + sep.length();
    }
    ret.emplace_back(str.substr(prev_pos));
    return ret;
}

/**
 * @brief Split the given text into lines. Only '\n' separates lines, and a trailing newline does
 * not produce an empty final line.
 */
inline std::vector<std::string_view> split_lines(std::string_view str) {
    std::vector<std::string_view> ret;
    while (!str.empty()) {
        auto nl = str.find('\n');
        ret.push_back(str.substr(0, nl));
        if (nl == str.npos) {
            break;
        }
        str.remove_prefix(nl + 1);
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

inline std::string joinstr(std::string_view joiner, const std::vector<std::string>& strs) {
    std::string ret;
    for (auto it = strs.cbegin(); it != strs.cend(); ++it) {
        ret.append(*it);
        if (std::next(it) != strs.cend()) {
            ret.append(joiner);
        }
    }
    return ret;
}

}  // namespace string_utils

}  // namespace modsel
