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
 * @brief A single 'require' line of a manifest
 */
struct requirement_line {
    std::string path;
    // The version as written in the manifest, including any leading 'v'
    std::string version;
    bool        indirect = false;
    int         line     = 0;

    friend bool operator==(const requirement_line&, const requirement_line&) = default;
};

/**
 * @brief The parsed contents of a module manifest (go.mod)
 */
struct manifest {
    std::string                   module_path;
    modsel::lang_version          lang_version;
    std::vector<requirement_line> requirements;
    modsel::replace_map           replaces;

    friend bool operator==(const manifest&, const manifest&) = default;
};

/**
 * @brief Parse the content of a manifest file.
 *
 * The `file` is only used for diagnostics. Errors carry errc::manifest_parse, e_parse_file,
 * e_parse_line (when the error is tied to a line), and an e_human_message.
 */
[[nodiscard]] result<manifest> parse_manifest(std::string_view             content,
                                              const std::filesystem::path& file);

/**
 * @brief Check that the manifest was written by a language version that records all transitive
 * requirements (1.17 or newer).
 */
[[nodiscard]] result<void> require_transitive_manifest(const manifest&              man,
                                                       const std::filesystem::path& file);

}  // namespace modsel
