#include "./table.hpp"

#include <modsel/util/string.hpp>

#include <nlohmann/json.hpp>

#include <cctype>

using namespace modsel;

std::string modsel::repo_name(std::string_view module_path) {
    auto segments = split(module_path, "/");
    auto labels   = split(segments.front(), ".");

    std::vector<std::string> parts(labels.rbegin(), labels.rend());
    parts.insert(parts.end(), segments.begin() + 1, segments.end());

    auto ret = joinstr("_", parts);
    for (char& c : ret) {
        c = std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::tolower(static_cast<unsigned char>(c)))
            : '_';
    }
    return ret;
}

module_table modsel::build_table(const resolution& res) {
    module_table ret;
    auto&        overrides = res.overrides;

    for (auto& [path, mod] : res.modules) {
        ret.config.importpaths.emplace(mod.repo_name, path);
        if (mod.source == module_source::external) {
            ret.config.module_names.emplace(mod.repo_name, *mod.provider);
            continue;
        }

        fetch_entry ent{.name = mod.repo_name, .importpath = path};
        if (auto build = overrides.find_build(path)) {
            ent.build_directives      = build->directives;
            ent.generation            = build->generation;
            ent.build_extra_args      = build->build_extra_args;
            if (auto conv = directive_value(build->directives, "go_naming_convention")) {
                ret.config.build_naming_conventions.emplace(mod.repo_name, *conv);
            }
        }
        if (auto patch = overrides.find_patch(path)) {
            ent.patches    = patch->patches;
            ent.patch_args = patch_args_for(patch->patch_strip);
        }

        if (auto archive = overrides.find_archive(path)) {
            ent.urls         = archive->urls;
            ent.strip_prefix = archive->strip_prefix;
            ent.sha256       = archive->sha256;
            ent.patches      = archive->patches;
            ent.patch_args   = patch_args_for(archive->patch_strip);
        } else if (mod.source == module_source::local) {
            ent.local_path = mod.local_dir;
        } else {
            ent.version = "v" + mod.raw_version;
            ent.sum     = mod.sum;
            ent.replace = mod.replace;
        }
        ret.repositories.push_back(std::move(ent));
    }

    ret.root_direct_deps.assign(res.root_direct_deps.begin(), res.root_direct_deps.end());
    ret.root_direct_dev_deps.assign(res.root_direct_dev_deps.begin(),
                                    res.root_direct_dev_deps.end());
    return ret;
}

nlohmann::json modsel::to_json(const fetch_entry& ent) {
    auto ret = nlohmann::json::object({
        {"name", ent.name},
        {"importpath", ent.importpath},
        {"build_directives", ent.build_directives},
        {"build_file_generation", std::string(to_string(ent.generation))},
        {"build_extra_args", ent.build_extra_args},
        {"patches", ent.patches},
        {"patch_args", ent.patch_args},
    });
    auto set_opt = [&](const char* key, const std::optional<std::string>& val) {
        if (val) {
            ret[key] = *val;
        }
    };
    set_opt("version", ent.version);
    set_opt("sum", ent.sum);
    set_opt("replace", ent.replace);
    set_opt("local_path", ent.local_path);
    set_opt("strip_prefix", ent.strip_prefix);
    set_opt("sha256", ent.sha256);
    if (!ent.urls.empty()) {
        ret["urls"] = ent.urls;
    }
    return ret;
}

nlohmann::json modsel::to_json(const module_table& table) {
    auto repos = nlohmann::json::array();
    for (auto& ent : table.repositories) {
        repos.push_back(to_json(ent));
    }
    return nlohmann::json::object({
        {"repositories", std::move(repos)},
        {"repository_config",
         {
             {"importpaths", table.config.importpaths},
             {"module_names", table.config.module_names},
             {"build_naming_conventions", table.config.build_naming_conventions},
         }},
        {"root_direct_deps", table.root_direct_deps},
        {"root_direct_dev_deps", table.root_direct_dev_deps},
    });
}
