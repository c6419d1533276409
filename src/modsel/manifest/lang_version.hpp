#pragma once

#include <modsel/error/result_fwd.hpp>

#include <compare>
#include <string>
#include <string_view>

namespace modsel {

/**
 * @brief The language version declared by a 'go' directive. Only the major and minor components
 * are kept.
 */
struct lang_version {
    int major = 1;
    int minor = 16;

    /**
     * @brief Parse a version such as "1.21", "1.21.3", or "1.21rc1". Patch and prerelease
     * components are dropped.
     */
    [[nodiscard]] static result<lang_version> parse(std::string_view);

    std::string to_string() const noexcept;

    auto operator<=>(const lang_version&) const noexcept = default;
    bool operator==(const lang_version&) const noexcept  = default;
};

}  // namespace modsel
