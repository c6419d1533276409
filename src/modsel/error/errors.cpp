#include "./errors.hpp"

#include <neo/assert.hpp>

using namespace modsel;

namespace {

std::string error_url_prefix = "https://modsel.dev/docs/err/";

std::string_view error_url_suffix(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_parse:
        return "manifest-parse.html";
    case errc::sum_parse:
        return "sum-parse.html";
    case errc::invalid_version:
        return "invalid-version.html";
    case errc::outdated_manifest:
        return "outdated-manifest.html";
    case errc::checksum_mismatch:
        return "checksum-mismatch.html";
    case errc::missing_checksum:
        return "missing-checksum.html";
    case errc::invalid_configuration:
        return "invalid-configuration.html";
    case errc::duplicate_override:
        return "duplicate-override.html";
    case errc::conflicting_override:
        return "conflicting-override.html";
    case errc::forbidden_override:
        return "forbidden-override.html";
    case errc::dangling_override:
        return "dangling-override.html";
    case errc::invalid_directive:
        return "invalid-directive.html";
    case errc::version_conflict:
        return "version-conflict.html";
    case errc::stale_direct_dependency:
        return "stale-direct-dependency.html";
    case errc::outdated_external_provider:
        return "outdated-external-provider.html";
    case errc::none:
        break;
    }
    neo::unreachable();
}

}  // namespace

error_class modsel::class_of(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_parse:
    case errc::sum_parse:
    case errc::invalid_version:
    case errc::outdated_manifest:
        return error_class::parse;
    case errc::checksum_mismatch:
    case errc::missing_checksum:
        return error_class::integrity;
    case errc::invalid_configuration:
    case errc::duplicate_override:
    case errc::conflicting_override:
    case errc::forbidden_override:
    case errc::dangling_override:
    case errc::invalid_directive:
        return error_class::configuration;
    case errc::version_conflict:
        return error_class::conflict;
    case errc::stale_direct_dependency:
    case errc::outdated_external_provider:
        return error_class::staleness;
    case errc::none:
        break;
    }
    neo::unreachable();
}

std::string_view modsel::class_name(error_class cls) noexcept {
    switch (cls) {
    case error_class::parse:
        return "parse error";
    case error_class::integrity:
        return "integrity error";
    case error_class::configuration:
        return "configuration error";
    case error_class::conflict:
        return "version conflict";
    case error_class::staleness:
        return "stale dependency";
    }
    neo::unreachable();
}

std::string modsel::error_reference_of(errc ec) noexcept {
    return error_url_prefix + std::string(error_url_suffix(ec));
}

std::string_view modsel::explanation_of(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_parse:
        return R"(
The manifest or workspace file could not be parsed. The file and line of the
offending text are shown above. No part of a malformed file is used.
)";
    case errc::sum_parse:
        return R"(
Every line of a checksum file must contain exactly three fields separated by a
single space: the module path, the module version, and the hash.
)";
    case errc::invalid_version:
        return R"(
Module versions must be valid semantic versions, optionally prefixed with 'v'.
Pseudo-versions and '+incompatible' suffixes are accepted.
)";
    case errc::outdated_manifest:
        return R"(
Only manifests that declare language version 1.17 or newer record the full set
of transitive requirements. Older manifests cannot be trusted to be complete.
)";
    case errc::checksum_mismatch:
        return R"(
Two checksum files disagree on the hash of the same module version. The lock
data is inconsistent or has been tampered with.
)";
    case errc::missing_checksum:
        return R"(
A module selected for fetching has no entry in any checksum file. This usually
means the checksum file is stale and the module tooling must be re-run.
)";
    case errc::invalid_configuration:
        return R"(
The evaluation configuration is invalid. Refer to the message above for the
offending declaration.
)";
    case errc::duplicate_override:
    case errc::conflicting_override:
        return R"(
Each module path may receive at most one override of each kind, and a module
cannot have both an archive override and a patch override.
)";
    case errc::forbidden_override:
        return R"(
Overrides may only be declared by the root configuration unit, unless the
evaluation is isolated to a single unit.
)";
    case errc::dangling_override:
        return R"(
Every override must target a module path that takes part in the final
resolution. Remove the override or correct its path.
)";
    case errc::invalid_directive:
        return R"(
Build directives must have the form "gazelle:key value".
)";
    case errc::version_conflict:
        return R"(
A single configuration unit requires the same module at two different versions.
The requirements must be brought into agreement before resolution can proceed.
)";
    case errc::stale_direct_dependency:
        return R"(
The root unit requires a module at a lower version than the one selected for
the build. Update the root requirement to make the upgrade explicit.
)";
    case errc::outdated_external_provider:
        return R"(
A module provided by another build dependency is older than the version that is
required. The required version will be fetched instead.
)";
    case errc::none:
        break;
    }
    neo::unreachable();
}

std::string_view modsel::default_error_string(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_parse:
        return "Failed to parse a manifest or workspace file";
    case errc::sum_parse:
        return "Failed to parse a checksum file";
    case errc::invalid_version:
        return "Invalid module version";
    case errc::outdated_manifest:
        return "The manifest was generated by a language version older than 1.17";
    case errc::checksum_mismatch:
        return "Mismatching checksums for a module version";
    case errc::missing_checksum:
        return "No checksum for a module selected for fetching";
    case errc::invalid_configuration:
        return "Invalid evaluation configuration";
    case errc::duplicate_override:
        return "Multiple overrides for the same module path";
    case errc::conflicting_override:
        return "Archive and patch overrides for the same module path";
    case errc::forbidden_override:
        return "Override declared outside of the root unit";
    case errc::dangling_override:
        return "Override does not target a resolved module";
    case errc::invalid_directive:
        return "Invalid build directive";
    case errc::version_conflict:
        return "Conflicting versions for a module within one unit";
    case errc::stale_direct_dependency:
        return "A direct dependency was upgraded during resolution";
    case errc::outdated_external_provider:
        return "An externally provided module is older than required";
    case errc::none:
        break;
    }
    neo::unreachable();
}
