#pragma once

#include <modsel/error/result_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

/**
 * @brief The tokens of a single manifest/workspace line, plus the text of a trailing '//'
 * comment, if one was present.
 */
struct tokenized_line {
    std::vector<std::string>   tokens;
    std::optional<std::string> comment;
};

/**
 * @brief Replace tabs and carriage returns with spaces. Directive values never contain them.
 */
std::string normalize_whitespace(std::string_view content);

/**
 * @brief Split a single (normalized) line into tokens.
 *
 * Three token forms are recognized: `backtick` strings are taken verbatim, "double-quoted"
 * strings treat a backslash as escaping the next character, and anything else runs up to the
 * next space. A `//` at the start of a token begins a comment that runs to the end of the line.
 *
 * An unterminated string is an error carrying errc::manifest_parse and an e_human_message. The
 * caller is responsible for attaching the file and line.
 */
[[nodiscard]] result<tokenized_line> tokenize_line(std::string_view line);

}  // namespace modsel
