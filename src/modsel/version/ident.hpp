#pragma once

#include "./order.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

class invalid_ident : public std::runtime_error {
    std::string _str;

public:
    explicit invalid_ident(std::string s)
        : std::runtime_error::runtime_error("Invalid version identifier: " + s)
        , _str(s) {}

    auto& string() const noexcept { return _str; }
};

enum class ident_kind {
    alphanumeric,
    numeric,
    // A string of digits with a leading zero. Compares as text.
    digits,
};

/**
 * @brief A single dot-separated identifier in a prerelease, build tag, or the extra release
 * segments of a relaxed version.
 */
class ident {
    std::string _str;
    ident_kind  _kind;

public:
    explicit ident(std::string_view str);

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }

    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return lhs._str == rhs._str;
    }

    static std::vector<ident> parse_dotted_seq(std::string_view s);
};

order compare(const ident& lhs, const ident& rhs) noexcept;

/**
 * @brief Lexicographically compare two identifier sequences. A shorter sequence that is a prefix
 * of a longer one orders first.
 */
order compare(const std::vector<ident>& lhs, const std::vector<ident>& rhs) noexcept;

std::string join_idents(const std::vector<ident>& ids);

}  // namespace modsel
