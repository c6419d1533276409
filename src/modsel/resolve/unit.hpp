#pragma once

#include <modsel/override/override.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modsel {

/**
 * @brief The name of the unit being processed when an error occurred
 */
struct e_unit_name {
    std::string value;
};

/**
 * @brief How a class of findings is reported
 */
enum class strictness {
    // Print an informational notice
    off,
    // Print a warning
    warning,
    // The finding is fatal
    error,
};

/**
 * @brief Settings that govern reporting. Only the root unit's configuration is honored.
 */
struct unit_config {
    // Staleness of the root unit's direct requirements and outdated external providers
    strictness check_direct_dependencies = strictness::warning;
    // Differing versions of the same module within a single unit
    strictness version_conflicts = strictness::error;
};

/**
 * @brief Load requirements from a go.mod or go.work file. Exactly one must be set.
 */
struct from_file_decl {
    std::optional<std::filesystem::path> go_mod;
    std::optional<std::filesystem::path> go_work;
    bool                                 dev_dependency = false;
};

/**
 * @brief An explicitly declared module requirement
 */
struct module_decl {
    std::string path;
    std::string version;
    // May be empty
    std::string sum;
    bool        indirect       = false;
    bool        dev_dependency = false;
};

/**
 * @brief A configuration unit: an independent source of requirements.
 */
struct unit {
    std::string name;
    // The unit's own version, used when it acts as the external provider of a Go module. An
    // empty version is newer than every other version.
    std::string                  version;
    bool                         is_root = false;
    std::optional<unit_config>   config;
    std::vector<from_file_decl>  from_file;
    std::vector<module_decl>     modules;
    std::vector<module_override> overrides;
};

/**
 * @brief The complete input to a single resolution
 */
struct evaluation {
    std::vector<unit> units;
    // When set, the evaluation contains a single unit that may declare overrides without being
    // the root.
    bool isolated = false;
};

}  // namespace modsel
