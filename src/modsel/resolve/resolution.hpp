#pragma once

#include <modsel/error/diagnostic.hpp>
#include <modsel/override/registry.hpp>
#include <modsel/version/version.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace modsel {

/**
 * @brief How a resolved module will be obtained
 */
enum class module_source {
    // Fetched from the module proxy at the selected version
    fetched,
    // Fetched at the version (and possibly the path) named by a replace directive
    replaced,
    // Taken from a local directory named by a replace directive
    local,
    // Provided by another unit, so nothing is fetched
    external,
};

struct resolved_module {
    std::string    path;
    std::string    repo_name;
    module_version version;
    // The selected version, without a leading 'v'
    std::string   raw_version;
    module_source source = module_source::fetched;
    // The replacement module path, if a replace directive changed it
    std::optional<std::string> replace{};
    std::optional<std::string> local_dir{};
    // Empty for modules that are not fetched from the proxy, or that use an archive override
    std::string sum{};
    // The unit that provides the module, for external modules
    std::optional<std::string> provider{};
};

/**
 * @brief The outcome of a successful evaluation
 */
struct resolution {
    std::map<std::string, resolved_module, std::less<>> modules;
    // Repository names of the root unit's direct requirements
    std::set<std::string> root_direct_deps;
    std::set<std::string> root_direct_dev_deps;
    override_registry     overrides;
    // Warnings and informational notices encountered along the way
    std::vector<diagnostic> notices;
};

}  // namespace modsel
