#pragma once

#include <modsel/error/result_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace modsel {

/**
 * @brief Controls whether BUILD files are generated for a fetched module
 */
enum class build_file_generation {
    automatic,
    on,
    off,
};

std::string_view                     to_string(build_file_generation) noexcept;
std::optional<build_file_generation> parse_build_file_generation(std::string_view) noexcept;

/**
 * @brief Fetch a module from the given archive instead of from the module proxy.
 */
struct archive_override {
    std::string              path;
    std::vector<std::string> urls;
    std::string              sha256;
    std::string              strip_prefix;
    std::vector<std::string> patches;
    int                      patch_strip = 0;

    friend bool operator==(const archive_override&, const archive_override&) = default;
};

/**
 * @brief Customize the build files that are generated for a module.
 */
struct build_override {
    std::string              path;
    std::vector<std::string> directives;
    build_file_generation    generation = build_file_generation::automatic;
    std::vector<std::string> build_extra_args;

    friend bool operator==(const build_override&, const build_override&) = default;
};

/**
 * @brief Apply patches to a module after it is fetched.
 */
struct patch_override {
    std::string              path;
    std::vector<std::string> patches;
    int                      patch_strip = 0;

    friend bool operator==(const patch_override&, const patch_override&) = default;
};

using module_override = std::variant<archive_override, build_override, patch_override>;

enum class override_kind {
    archive,
    build,
    patch,
};

override_kind kind_of(const module_override&) noexcept;

/**
 * @brief The name of an override kind as it is spelled in configuration files
 */
std::string_view kind_name(override_kind) noexcept;

const std::string& path_of(const module_override&) noexcept;

/**
 * @brief Check that the given string has the form "gazelle:key value".
 */
result<void> check_directive(std::string_view directive);

/**
 * @brief Find the value of the last "gazelle:<key> <value>" directive in the list.
 */
std::optional<std::string> directive_value(const std::vector<std::string>& directives,
                                           std::string_view                key);

/**
 * @brief Generate the arguments for the patch tool that correspond to a strip count
 */
std::vector<std::string> patch_args_for(int patch_strip);

}  // namespace modsel
