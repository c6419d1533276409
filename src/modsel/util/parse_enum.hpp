#pragma once

#include <modsel/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <vector>
#include <string>

namespace modsel {

template <typename E>
struct e_invalid_enum {
    std::string value;
};

struct e_invalid_enum_str {
    std::string value;
};

struct e_enum_options {
    std::string value;
};

/**
 * @brief Parse the name of an enumerator, throwing with the list of valid names on failure
 */
template <typename E>
constexpr auto parse_enum_str = [](const std::string& sv) {
    auto e = magic_enum::enum_cast<E>(sv);
    if (e.has_value()) {
        return *e;
    }

    BOOST_LEAF_THROW_EXCEPTION(  //
        e_invalid_enum<E>{std::string(magic_enum::enum_type_name<E>())},
        e_invalid_enum_str{std::string(sv)},
        [&] {
            std::vector<std::string> quoted;
            for (auto n : magic_enum::enum_names<E>()) {
                quoted.push_back(std::string{"\""} + std::string(n) + "\"");
            }
            return e_enum_options{joinstr(", ", quoted)};
        });
};

}  // namespace modsel
