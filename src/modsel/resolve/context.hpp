#pragma once

#include "./file_source.hpp"
#include "./resolution.hpp"
#include "./unit.hpp"

#include <modsel/error/diagnostic.hpp>
#include <modsel/manifest/replace.hpp>
#include <modsel/override/registry.hpp>
#include <modsel/sum/store.hpp>
#include <modsel/version/version.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace modsel {

/**
 * @brief A unit that provides a Go module itself, rather than having it fetched
 */
struct external_provider {
    std::string    module_path;
    std::string    unit_name;
    module_version version;
    // Empty if the unit has no version
    std::string raw_version;
};

/**
 * @brief The version of a module that the root unit directly requires
 */
struct root_request {
    std::string    raw_version;
    module_version version;
};

/**
 * @brief All of the state accumulated during a single evaluation.
 *
 * A context is created for each evaluation and discarded when it completes.
 */
struct resolution_context {
    const evaluation&  eval;
    const file_source& files;

    unit_config       config{};
    sum_store         sums{};
    override_registry overrides{};
    replace_map       replaces{};

    std::map<std::string, external_provider, std::less<>> externals{};
    std::map<std::string, resolved_module, std::less<>>   resolved{};
    std::map<std::string, root_request, std::less<>>      root_versions{};
    // Paths of the root unit's direct requirements
    std::set<std::string, std::less<>> root_direct{};
    std::set<std::string, std::less<>> root_direct_dev{};

    // Fatal diagnostics, reported together when the evaluation completes
    std::vector<diagnostic> deferred{};
    // Non-fatal diagnostics
    std::vector<diagnostic> notices{};

    /// Record a fatal diagnostic
    void defer(diagnostic d) { deferred.push_back(std::move(d)); }
    void defer_all(std::vector<diagnostic> ds);

    /**
     * @brief Report a diagnostic with the given strictness.
     *
     * 'off' and 'warning' print the diagnostic and add it to the notices. 'error' defers it.
     */
    void report(diagnostic d, strictness s);
};

}  // namespace modsel
