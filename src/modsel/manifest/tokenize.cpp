#include "./tokenize.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>
#include <modsel/util/string.hpp>

#include <algorithm>

using namespace modsel;

std::string modsel::normalize_whitespace(std::string_view content) {
    std::string ret{content};
    std::ranges::replace(ret, '\t', ' ');
    std::ranges::replace(ret, '\r', ' ');
    return ret;
}

result<tokenized_line> modsel::tokenize_line(std::string_view line) {
    tokenized_line ret;
    auto           remain = line;
    while (true) {
        remain = trim_view(remain);
        if (remain.empty()) {
            break;
        }

        if (remain[0] == '`') {
            auto end = remain.find('`', 1);
            if (end == remain.npos) {
                return new_error(errc::manifest_parse, e_human_message{"unterminated raw string"});
            }
            ret.tokens.emplace_back(remain.substr(1, end - 1));
            remain.remove_prefix(end + 1);
        } else if (remain[0] == '"') {
            std::string value;
            bool        escaped   = false;
            bool        found_end = false;
            auto        pos       = std::size_t(1);
            for (; pos < remain.size(); ++pos) {
                char c = remain[pos];
                if (escaped) {
                    value.push_back(c);
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    found_end = true;
                    break;
                } else {
                    value.push_back(c);
                }
            }
            if (!found_end) {
                return new_error(errc::manifest_parse,
                                 e_human_message{"unterminated interpreted string"});
            }
            ret.tokens.push_back(std::move(value));
            remain.remove_prefix(pos + 1);
        } else if (remain.starts_with("//")) {
            ret.comment = std::string(trim_view(remain.substr(2)));
            break;
        } else {
            auto space = remain.find(' ');
            ret.tokens.emplace_back(remain.substr(0, space));
            remain.remove_prefix(space == remain.npos ? remain.size() : space);
        }
    }
    return ret;
}
