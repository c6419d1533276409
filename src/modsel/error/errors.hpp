#pragma once

#include <string>
#include <string_view>

namespace modsel {

/**
 * @brief Enumeration of the failure conditions that can be reported while reading manifests and
 * resolving module versions.
 *
 * An errc may be attached directly to a LEAF error, or carried in a `diagnostic`.
 */
enum class errc {
    none = 0,

    manifest_parse,
    sum_parse,
    invalid_version,
    outdated_manifest,

    checksum_mismatch,
    missing_checksum,

    invalid_configuration,
    duplicate_override,
    conflicting_override,
    forbidden_override,
    dangling_override,
    invalid_directive,

    version_conflict,

    stale_direct_dependency,
    outdated_external_provider,
};

/**
 * @brief The broad class of a failure, used to group and order reports
 */
enum class error_class {
    parse,
    integrity,
    configuration,
    conflict,
    staleness,
};

error_class      class_of(errc) noexcept;
std::string_view class_name(error_class) noexcept;
std::string      error_reference_of(errc) noexcept;
std::string_view explanation_of(errc) noexcept;
std::string_view default_error_string(errc) noexcept;

}  // namespace modsel
