#include "./conflict.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

using namespace modsel;

namespace {

std::string remediation_text(std::optional<conflict_remedy> remedy, std::string_view path) {
    if (!remedy) {
        return neo::ufmt("To correct this, declare a single version of '{}' in this unit.", path);
    }
    switch (*remedy) {
    case conflict_remedy::manual_fix:
        return neo::ufmt("To correct this:\n"
                         " 1. manually update: all go.mod files to ensure the versions of '{}' are "
                         "the same.\n"
                         " 2. in the folder where you made changes to run: go mod tidy\n"
                         " 3. run: go work sync.",
                         path);
    case conflict_remedy::resync_manifest:
        return neo::ufmt("To correct this:\n"
                         " 1. update the go.mod file that requires '{}' indirectly.\n"
                         " 2. in that folder run: go mod tidy\n"
                         " 3. run: go work sync.",
                         path);
    case conflict_remedy::resync_workspace:
        return "To correct this, run:\n 1. go work sync.";
    }
    neo::unreachable();
}

}  // namespace

std::optional<conflict_remedy> modsel::classify_conflict(const requirement& previous,
                                                         const requirement& current) noexcept {
    if (previous.origin.traces_to_workspace() || current.origin.traces_to_workspace()
        || previous.version.major != current.version.major) {
        return conflict_remedy::manual_fix;
    }
    if (previous.indirect || current.indirect) {
        return conflict_remedy::resync_manifest;
    }
    if (previous.origin.kind == provenance::declaration
        && current.origin.kind == provenance::declaration) {
        return conflict_remedy::resync_workspace;
    }
    return std::nullopt;
}

diagnostic modsel::conflict_diagnostic(const requirement&             previous,
                                       const requirement&             current,
                                       std::optional<conflict_remedy> remedy) {
    return diagnostic{
        .code        = errc::version_conflict,
        .message     = neo::ufmt("Multiple versions of {} found:\n"
                             " - {} contains: v{}\n"
                             " - {} contains v{}.",
                             current.path,
                             current.origin.to_string(),
                             current.raw_version,
                             previous.origin.to_string(),
                             previous.raw_version),
        .remediation = remediation_text(remedy, current.path),
        .module_path = current.path,
    };
}
