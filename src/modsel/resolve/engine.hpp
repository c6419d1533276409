#pragma once

#include "./file_source.hpp"
#include "./resolution.hpp"
#include "./unit.hpp"

#include <modsel/error/result_fwd.hpp>

namespace modsel {

/**
 * @brief Select a version for every module required by the units of an evaluation.
 *
 * Units are processed in order. Each unit's requirements are merged, then the highest
 * version of each path across all units is selected. Replace directives, external providers and
 * overrides are applied to the selection afterwards, and checksums are attached.
 *
 * Malformed input and invalid configuration fail immediately. Other fatal problems are collected
 * until the evaluation completes, then reported together as an e_diagnostics with the errc of the
 * first of them.
 */
result<resolution> resolve(const evaluation& eval, const file_source& files);

}  // namespace modsel
