#include "./ident.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

using namespace modsel;

ident::ident(std::string_view str) {
    if (str.empty()) {
        throw invalid_ident(std::string(str));
    }
    bool any_alpha = false;
    for (char c : str) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-') {
            throw invalid_ident(std::string(str));
        }
        any_alpha = any_alpha || c == '-' || std::isalpha(uc);
    }

    _str = std::string(str);

    if (any_alpha) {
        _kind = ident_kind::alphanumeric;
    } else if (_str.size() > 1 && _str[0] == '0') {
        _kind = ident_kind::digits;
    } else {
        _kind = ident_kind::numeric;
        std::uint64_t n;
        auto          res = std::from_chars(_str.data(), _str.data() + _str.size(), n);
        if (res.ec != std::errc{} || res.ptr != _str.data() + _str.size()) {
            // Too large to be compared numerically
            throw invalid_ident(_str);
        }
    }
}

std::vector<ident> ident::parse_dotted_seq(const std::string_view s) {
    std::vector<ident> acc;
    auto               remaining = s;

    while (!remaining.empty()) {
        auto next_dot = remaining.find('.');
        auto id_sub   = remaining.substr(0, next_dot);
        if (id_sub.empty()) {
            throw invalid_ident(std::string(s));
        }
        acc.emplace_back(id_sub);
        if (next_dot == remaining.npos) {
            break;
        }
        remaining = remaining.substr(next_dot + 1);
        if (remaining.empty()) {
            throw invalid_ident(std::string(s));
        }
    }
    if (acc.empty()) {
        throw invalid_ident(std::string(s));
    }
    return acc;
}

namespace {

std::uint64_t as_int(const std::string& str) noexcept {
    std::uint64_t value = 0;
    std::from_chars(str.data(), str.data() + str.size(), value);
    return value;
}

template <typename T>
order order_of(const T& lhs, const T& rhs) noexcept {
    if (lhs < rhs) {
        return order::less;
    } else if (rhs < lhs) {
        return order::greater;
    }
    return order::equivalent;
}

}  // namespace

order modsel::compare(const ident& lhs, const ident& rhs) noexcept {
    const bool lhs_num = lhs.kind() == ident_kind::numeric;
    const bool rhs_num = rhs.kind() == ident_kind::numeric;
    if (lhs_num && rhs_num) {
        return order_of(as_int(lhs.string()), as_int(rhs.string()));
    } else if (lhs_num) {
        // Numeric identifiers always have lower precedence
        return order::less;
    } else if (rhs_num) {
        return order::greater;
    }
    return order_of(lhs.string(), rhs.string());
}

order modsel::compare(const std::vector<ident>& lhs, const std::vector<ident>& rhs) noexcept {
    auto       lhs_iter = lhs.cbegin();
    auto       rhs_iter = rhs.cbegin();
    const auto lhs_end  = lhs.cend();
    const auto rhs_end  = rhs.cend();

    for (; lhs_iter != lhs_end && rhs_iter != rhs_end; ++lhs_iter, ++rhs_iter) {
        auto ord = compare(*lhs_iter, *rhs_iter);
        if (ord != order::equivalent) {
            return ord;
        }
    }
    if (lhs_iter != lhs_end) {
        return order::greater;
    } else if (rhs_iter != rhs_end) {
        return order::less;
    }
    return order::equivalent;
}

std::string modsel::join_idents(const std::vector<ident>& ids) {
    std::string acc;
    for (auto it = ids.cbegin(); it != ids.cend(); ++it) {
        if (it != ids.cbegin()) {
            acc.push_back('.');
        }
        acc.append(it->string());
    }
    return acc;
}
