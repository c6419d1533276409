#pragma once

#include <modsel/dym.hpp>
#include <modsel/util/parse_enum.hpp>

#include <boost/leaf/exception.hpp>
#include <json5/data.hpp>
#include <neo/assert.hpp>
#include <semester/walk.hpp>

#include <cmath>
#include <limits>
#include <ranges>
#include <set>
#include <string>
#include <string_view>

namespace modsel::walk_utils {

using namespace semester::walk_ops;
using semester::walk_error;

using json5_mapping   = json5::data::mapping_type;
using json5_array     = json5::data::array_type;
using require_mapping = semester::require_type<json5_mapping>;
using require_array   = semester::require_type<json5_array>;
using require_str     = semester::require_type<std::string>;

/**
 * @brief Convert a JSON number into a non-negative integer, or throw a walk_error with the given
 * message.
 */
struct count_from_number {
    std::string_view message;

    int operator()(double d) const {
        // The range check must come first: casting an unrepresentable double is undefined
        if (!std::isfinite(d) || d < 0 || d > std::numeric_limits<int>::max()
            || std::trunc(d) != d) {
            throw semester::walk_error{std::string(message)};
        }
        return static_cast<int>(d);
    }
};

/**
 * @brief Records the keys seen in a mapping. The rejecter throws `E` for an unknown key, naming
 * the nearest known key that has not been given.
 */
struct key_dym_tracker {
    std::set<std::string_view, std::less<>> known_keys;
    std::set<std::string, std::less<>>      seen_keys = {};

    auto tracker() {
        return [this](auto&& key, auto&&) {
            seen_keys.emplace(std::string(key));
            return walk.pass;
        };
    }

    template <typename E>
    auto rejecter() {
        return [this](auto&& key, auto&&) -> semester::walk_result {
            auto unseen
                = known_keys | std::views::filter([&](auto k) { return !seen_keys.contains(k); });
            BOOST_LEAF_THROW_EXCEPTION(E{std::string(key), did_you_mean(key, unseen)});
            neo::unreachable();
        };
    }
};

}  // namespace modsel::walk_utils
