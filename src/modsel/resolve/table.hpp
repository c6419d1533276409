#pragma once

#include "./resolution.hpp"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

/**
 * @brief Compute the repository name for a module path.
 *
 * The labels of the domain are reversed, and every character that is not alphanumeric becomes an
 * underscore: "github.com/Foo-Bar/baz" becomes "com_github_foo_bar_baz".
 */
std::string repo_name(std::string_view module_path);

/**
 * @brief Everything needed to fetch and build a single module
 */
struct fetch_entry {
    std::string name;
    std::string importpath;

    // Set when the module is fetched from the module proxy
    std::optional<std::string> version{};
    std::optional<std::string> sum{};
    std::optional<std::string> replace{};

    // Set when the module is taken from a local directory
    std::optional<std::string> local_path{};

    // Set when the module is fetched from an archive
    std::vector<std::string>   urls{};
    std::optional<std::string> strip_prefix{};
    std::optional<std::string> sha256{};

    std::vector<std::string> build_directives{};
    build_file_generation    generation = build_file_generation::automatic;
    std::vector<std::string> build_extra_args{};
    std::vector<std::string> patches{};
    std::vector<std::string> patch_args{};
};

/**
 * @brief The information that BUILD file generation needs about every known repository
 */
struct repository_config {
    // Repository name to import path, for every resolved module
    std::map<std::string, std::string> importpaths;
    // Repository name to the name of the providing unit, for external modules
    std::map<std::string, std::string> module_names;
    // Repository name to the value of its "gazelle:go_naming_convention" directive
    std::map<std::string, std::string> build_naming_conventions;
};

struct module_table {
    std::vector<fetch_entry> repositories;
    repository_config        config;
    std::vector<std::string> root_direct_deps;
    std::vector<std::string> root_direct_dev_deps;
};

/**
 * @brief Combine the resolved modules with their overrides into the final table.
 */
module_table build_table(const resolution&);

nlohmann::json to_json(const fetch_entry&);
nlohmann::json to_json(const module_table&);

}  // namespace modsel
