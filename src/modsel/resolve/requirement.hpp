#pragma once

#include <modsel/error/result_fwd.hpp>
#include <modsel/version/version.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace modsel {

/**
 * @brief Where a requirement was declared
 */
struct provenance {
    enum kind_t {
        // An explicit module declaration in a unit
        declaration,
        // A 'require' line in a go.mod file
        manifest,
        // A versioned 'replace' line in a go.work file
        workspace,
    };

    kind_t      kind = declaration;
    std::string unit;
    // The file that the requirement came from. Empty for declarations.
    std::filesystem::path file{};
    // The go.work file through which the manifest was reached, if any
    std::optional<std::filesystem::path> via_workspace{};

    /// Whether this requirement came from a workspace, either directly or through a 'use'
    bool traces_to_workspace() const noexcept {
        return kind == workspace || via_workspace.has_value();
    }

    /// A short label used to identify the source in messages
    std::string to_string() const noexcept;
};

/**
 * @brief A single requirement on a module at a version, declared by a unit.
 */
struct requirement {
    std::string path;
    // The canonical version string, without a leading 'v'
    std::string    raw_version;
    module_version version;
    bool           indirect       = false;
    bool           dev_dependency = false;
    provenance     origin;

    /**
     * @brief Create a requirement, parsing the given version string.
     *
     * The version may be written with or without a leading 'v'. A version that is not a valid
     * semantic version is a parse error naming the path and the origin.
     */
    static result<requirement> create(std::string_view path,
                                      std::string_view version,
                                      bool             indirect,
                                      bool             dev_dependency,
                                      provenance       origin);
};

}  // namespace modsel
