#pragma once

#include "./lang_version.hpp"
#include "./replace.hpp"

#include <modsel/error/result_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

/**
 * @brief A 'use' entry of a workspace, together with the manifest it refers to
 */
struct workspace_use {
    // The cleaned directory, relative to the workspace. Empty for the workspace directory itself.
    std::string directory;
    // The path of the manifest file within that directory
    std::filesystem::path manifest_path;
    int                   line = 0;

    friend bool operator==(const workspace_use&, const workspace_use&) = default;
};

/**
 * @brief The parsed contents of a workspace file (go.work)
 */
struct workspace {
    modsel::lang_version       lang_version;
    std::vector<workspace_use> uses;
    modsel::replace_map        replaces;

    friend bool operator==(const workspace&, const workspace&) = default;
};

/**
 * @brief Validate and clean the directory named by a 'use' directive.
 *
 * Paths with a '..' segment or absolute paths are rejected. A leading "./" and trailing "/" are
 * removed, and "." becomes the empty string.
 */
[[nodiscard]] result<std::string> clean_use_directory(std::string_view spelling);

/**
 * @brief Parse the content of a workspace file.
 *
 * Each 'use' entry is resolved to a manifest named "go.mod" in a directory relative to the
 * directory containing `file`. Errors carry errc::manifest_parse, e_parse_file, e_parse_line,
 * and an e_human_message.
 */
[[nodiscard]] result<workspace> parse_workspace(std::string_view             content,
                                                const std::filesystem::path& file);

}  // namespace modsel
