#pragma once

#include "./argument.hpp"
#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>

namespace debate {

/**
 * @brief Assigns an enumerator by name. Underscores in enumerator names are spelled as hyphens,
 * and trailing underscores are dropped.
 */
template <typename E>
class enum_putter {
    E* _dest;

    static std::string _spelling_of(std::string_view ident) {
        std::string ret(ident);
        std::ranges::replace(ret, '_', '-');
        while (ret.ends_with('-')) {
            ret.pop_back();
        }
        return ret;
    }

public:
    constexpr explicit enum_putter(E& e) noexcept
        : _dest(&e) {}

    void operator()(std::string_view given, std::string_view spelling) const {
        for (auto [value, name] : magic_enum::enum_entries<E>()) {
            if (_spelling_of(name) == given) {
                *_dest = value;
                return;
            }
        }
        BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value for enumerated argument"),
                                   e_invalid_arg_value{std::string(given)},
                                   e_arg_spelling{std::string(spelling)});
    }
};

template <typename E>
constexpr auto make_enum_putter(E& dest) noexcept {
    return enum_putter<E>(dest);
}

}  // namespace debate
