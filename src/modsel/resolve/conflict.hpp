#pragma once

#include "./requirement.hpp"

#include <modsel/error/diagnostic.hpp>

#include <optional>

namespace modsel {

/**
 * @brief The corrective action for two differing requirements on the same path within one unit
 */
enum class conflict_remedy {
    // The go.mod files must be updated by hand, then tidied and synced
    manual_fix,
    // An indirect requirement is out of date in the manifest that declares it
    resync_manifest,
    // Running 'go work sync' will reconcile the versions
    resync_workspace,
};

/**
 * @brief Decide how two conflicting requirements on the same path may be corrected.
 *
 * - If either requirement comes from a workspace, or their major versions differ: manual_fix.
 * - Otherwise, if either is indirect: resync_manifest.
 * - Otherwise, if both are explicit declarations: resync_workspace.
 *
 * Any other combination has no known remedy and returns nullopt. Such conflicts are always fatal.
 */
std::optional<conflict_remedy> classify_conflict(const requirement& previous,
                                                 const requirement& current) noexcept;

/**
 * @brief Create the version_conflict diagnostic that names both requirements.
 */
diagnostic conflict_diagnostic(const requirement&             previous,
                               const requirement&             current,
                               std::optional<conflict_remedy> remedy);

}  // namespace modsel
