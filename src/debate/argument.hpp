#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>

#include <charconv>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

template <typename E>
constexpr auto make_enum_putter(E& dest) noexcept;

/**
 * @brief Assign the value to the destination by constructing a `T` from the string
 */
template <typename T>
class value_putter {
    T& _dest;

public:
    explicit value_putter(T& dest) noexcept
        : _dest(dest) {}

    void operator()(std::string_view value, std::string_view) { _dest = T(value); }
};

template <typename Int>
class integer_putter {
    Int& _dest;

public:
    explicit integer_putter(Int& d) noexcept
        : _dest(d) {}

    void operator()(std::string_view value, std::string_view spelling) {
        auto res = std::from_chars(value.data(), value.data() + value.size(), _dest);
        if (res.ec != std::errc{} || res.ptr != value.data() + value.size()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected an integer value"),
                                       e_arg_spelling{std::string(spelling)},
                                       e_invalid_arg_value{std::string(value)});
        }
    }
};

template <typename T>
constexpr auto make_argument_putter(T& dest) {
    if constexpr (std::is_enum_v<T>) {
        // Requires <debate/enum.hpp>
        return make_enum_putter(dest);
    } else if constexpr (std::is_integral_v<T>) {
        return integer_putter(dest);
    } else {
        return value_putter{dest};
    }
}

constexpr inline auto store_value = [](auto& dest, auto val) {
    return [&dest, val](std::string_view = {}, std::string_view = {}) { dest = val; };
};

constexpr inline auto store_true = [](auto& dest) { return store_value(dest, true); };

constexpr inline auto put_into = [](auto& dest) { return make_argument_putter(dest); };

constexpr inline auto push_back_onto = [](auto& dest) {
    return [&dest](std::string_view value, std::string_view = {}) { dest.emplace_back(value); };
};

/**
 * @brief A single command-line argument. An argument with no spellings is positional.
 *
 * Options take either zero or one value (`nargs`).
 */
struct argument {
    std::vector<std::string> long_spellings{};
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required   = false;
    int  nargs      = 1;
    bool can_repeat = false;

    std::function<void(std::string_view value, std::string_view spelling)> action;

    // Arguments are referred to by address while parsing
    std::unique_ptr<int> _make_noncopyable{};

    bool is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }

    /**
     * @brief If `given` (without the leading '--') names this argument, returns the name that
     * matched. Matches either 'name' or 'name=value'.
     */
    std::optional<std::string_view> match_long(std::string_view given) const noexcept;

    /**
     * @brief If `given` (without the leading '-') begins with a short spelling of this argument,
     * returns the spelling that matched
     */
    std::optional<std::string_view> match_short(std::string_view given) const noexcept;

    std::string preferred_spelling() const noexcept;
    std::string syntax_string() const noexcept;
    std::string help_string() const noexcept;

    /// Copy this argument, for use in more than one parser
    argument dup() const noexcept {
        return argument{
            .long_spellings  = long_spellings,
            .short_spellings = short_spellings,
            .help            = help,
            .valname         = valname,
            .required        = required,
            .nargs           = nargs,
            .can_repeat      = can_repeat,
            .action          = action,
        };
    }
};

}  // namespace debate
