#include "./load.hpp"

#include "./error.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/try_catch.hpp>
#include <modsel/util/json_walk.hpp>
#include <modsel/util/log.hpp>
#include <modsel/util/yaml/convert.hpp>
#include <modsel/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

using namespace modsel;
using namespace modsel::walk_utils;

namespace fs = std::filesystem;

namespace {

struct path_from_string {
    const fs::path& base_dir;

    fs::path operator()(std::string s) const { return (base_dir / s).lexically_normal(); }
};

auto parse_strictness = [](std::string s) { return parse_enum_str<strictness>(s); };

unit_config parse_unit_config(const json5::data& data) {
    unit_config     ret;
    key_dym_tracker dym{{"check_direct_dependencies", "version_conflicts"}};
    walk(data,
         require_mapping{"Unit 'config' must be a mapping"},
         mapping{
             dym.tracker(),
             if_key{"check_direct_dependencies",
                    require_str{"'check_direct_dependencies' must be a string"},
                    put_into{ret.check_direct_dependencies, parse_strictness}},
             if_key{"version_conflicts",
                    require_str{"'version_conflicts' must be a string"},
                    put_into{ret.version_conflicts, parse_strictness}},
             dym.rejecter<e_bad_config_key>(),
         });
    return ret;
}

struct from_file_from_data {
    const fs::path& base_dir;

    from_file_decl operator()(const json5::data& data) const {
        from_file_decl  ret;
        key_dym_tracker dym{{"go_mod", "go_work", "dev_dependency"}};
        walk(data,
             require_mapping{"Each 'from_file' must be a mapping"},
             mapping{
                 dym.tracker(),
                 if_key{"go_mod",
                        require_str{"'go_mod' must be a string"},
                        put_into{ret.go_mod, path_from_string{base_dir}}},
                 if_key{"go_work",
                        require_str{"'go_work' must be a string"},
                        put_into{ret.go_work, path_from_string{base_dir}}},
                 if_key{"dev_dependency",
                        require_type<bool>("'dev_dependency' must be a boolean"),
                        put_into{ret.dev_dependency}},
                 dym.rejecter<e_bad_config_key>(),
             });
        return ret;
    }
};

module_decl module_from_data(const json5::data& data) {
    module_decl     ret;
    key_dym_tracker dym{{"path", "version", "sum", "indirect", "dev_dependency"}};
    walk(data,
         require_mapping{"Each 'modules' element must be a mapping"},
         mapping{
             dym.tracker(),
             required_key{"path",
                          "A module declaration requires a 'path'",
                          require_str{"Module 'path' must be a string"},
                          put_into{ret.path}},
             required_key{"version",
                          "A module declaration requires a 'version'",
                          require_str{"Module 'version' must be a string"},
                          put_into{ret.version}},
             if_key{"sum", require_str{"Module 'sum' must be a string"}, put_into{ret.sum}},
             if_key{"indirect",
                    require_type<bool>("Module 'indirect' must be a boolean"),
                    put_into{ret.indirect}},
             if_key{"dev_dependency",
                    require_type<bool>("Module 'dev_dependency' must be a boolean"),
                    put_into{ret.dev_dependency}},
             dym.rejecter<e_bad_config_key>(),
         });
    return ret;
}

module_override archive_from_data(const json5::data& data) {
    archive_override ret;
    key_dym_tracker  dym{{"path", "urls", "sha256", "strip_prefix", "patches", "patch_strip"}};
    walk(data,
         require_mapping{"Each 'archive_overrides' element must be a mapping"},
         mapping{
             dym.tracker(),
             required_key{"path",
                          "An archive override requires a 'path'",
                          require_str{"Override 'path' must be a string"},
                          put_into{ret.path}},
             required_key{"urls",
                          "An archive override requires 'urls'",
                          require_array{"Override 'urls' must be an array"},
                          for_each{require_str{"Each override URL must be a string"},
                                   put_into(std::back_inserter(ret.urls))}},
             if_key{"sha256", require_str{"Override 'sha256' must be a string"}, put_into{ret.sha256}},
             if_key{"strip_prefix",
                    require_str{"Override 'strip_prefix' must be a string"},
                    put_into{ret.strip_prefix}},
             if_key{"patches",
                    require_array{"Override 'patches' must be an array"},
                    for_each{require_str{"Each override patch must be a string"},
                             put_into(std::back_inserter(ret.patches))}},
             if_key{"patch_strip",
                    require_type<double>("Override 'patch_strip' must be a number"),
                    put_into{ret.patch_strip,
                             count_from_number{"Override 'patch_strip' must be a whole number "
                                               "that is not negative"}}},
             dym.rejecter<e_bad_config_key>(),
         });
    if (ret.urls.empty()) {
        throw semester::walk_error{
            neo::ufmt("Archive override for '{}' must provide at least one URL", ret.path)};
    }
    return ret;
}

module_override gazelle_from_data(const json5::data& data) {
    build_override  ret;
    key_dym_tracker dym{{"path", "directives", "build_file_generation", "build_extra_args"}};
    walk(data,
         require_mapping{"Each 'gazelle_overrides' element must be a mapping"},
         mapping{
             dym.tracker(),
             required_key{"path",
                          "A gazelle override requires a 'path'",
                          require_str{"Override 'path' must be a string"},
                          put_into{ret.path}},
             if_key{"directives",
                    require_array{"Override 'directives' must be an array"},
                    for_each{require_str{"Each override directive must be a string"},
                             put_into(std::back_inserter(ret.directives))}},
             if_key{"build_file_generation",
                    require_str{"Override 'build_file_generation' must be a string"},
                    put_into{ret.generation,
                             [](std::string s) {
                                 auto gen = parse_build_file_generation(s);
                                 if (!gen) {
                                     throw semester::walk_error{neo::ufmt(
                                         "Invalid 'build_file_generation' \"{}\". Expected one of "
                                         "\"auto\", \"on\", or \"off\"",
                                         s)};
                                 }
                                 return *gen;
                             }}},
             if_key{"build_extra_args",
                    require_array{"Override 'build_extra_args' must be an array"},
                    for_each{require_str{"Each 'build_extra_args' element must be a string"},
                             put_into(std::back_inserter(ret.build_extra_args))}},
             dym.rejecter<e_bad_config_key>(),
         });
    return ret;
}

module_override patch_from_data(const json5::data& data) {
    patch_override  ret;
    key_dym_tracker dym{{"path", "patches", "patch_strip"}};
    walk(data,
         require_mapping{"Each 'module_overrides' element must be a mapping"},
         mapping{
             dym.tracker(),
             required_key{"path",
                          "A module override requires a 'path'",
                          require_str{"Override 'path' must be a string"},
                          put_into{ret.path}},
             if_key{"patches",
                    require_array{"Override 'patches' must be an array"},
                    for_each{require_str{"Each override patch must be a string"},
                             put_into(std::back_inserter(ret.patches))}},
             if_key{"patch_strip",
                    require_type<double>("Override 'patch_strip' must be a number"),
                    put_into{ret.patch_strip,
                             count_from_number{"Override 'patch_strip' must be a whole number "
                                               "that is not negative"}}},
             dym.rejecter<e_bad_config_key>(),
         });
    return ret;
}

struct unit_from_data {
    const fs::path& base_dir;

    unit operator()(const json5::data& data) const {
        unit            ret;
        key_dym_tracker dym{{
            "name",
            "version",
            "root",
            "config",
            "from_file",
            "modules",
            "archive_overrides",
            "gazelle_overrides",
            "module_overrides",
        }};
        auto from_file = from_file_from_data{base_dir};
        walk(data,
             require_mapping{"Each 'units' element must be a mapping"},
             mapping{
                 dym.tracker(),
                 required_key{"name",
                              "A unit requires a 'name'",
                              require_str{"Unit 'name' must be a string"},
                              put_into{ret.name}},
                 if_key{"version",
                        require_str{"Unit 'version' must be a string. Quote the version if it "
                                    "looks like a number."},
                        put_into{ret.version}},
                 if_key{"root",
                        require_type<bool>("Unit 'root' must be a boolean"),
                        put_into{ret.is_root}},
                 if_key{"config", put_into{ret.config, parse_unit_config}},
                 if_key{"from_file",
                        if_type<json5_array>(
                            for_each{put_into(std::back_inserter(ret.from_file), from_file)}),
                        put_into(std::back_inserter(ret.from_file), from_file)},
                 if_key{"modules",
                        require_array{"Unit 'modules' must be an array"},
                        for_each{put_into(std::back_inserter(ret.modules), module_from_data)}},
                 if_key{"archive_overrides",
                        require_array{"Unit 'archive_overrides' must be an array"},
                        for_each{put_into(std::back_inserter(ret.overrides), archive_from_data)}},
                 if_key{"gazelle_overrides",
                        require_array{"Unit 'gazelle_overrides' must be an array"},
                        for_each{put_into(std::back_inserter(ret.overrides), gazelle_from_data)}},
                 if_key{"module_overrides",
                        require_array{"Unit 'module_overrides' must be an array"},
                        for_each{put_into(std::back_inserter(ret.overrides), patch_from_data)}},
                 dym.rejecter<e_bad_config_key>(),
             });
        return ret;
    }
};

}  // namespace

evaluation modsel::evaluation_from_data(const json5::data& data, const fs::path& base_dir) {
    return modsel_leaf_try {
        evaluation      ret;
        key_dym_tracker dym{{"isolated", "units"}};
        walk(data,
             require_mapping{"The root of the configuration must be a mapping"},
             mapping{
                 dym.tracker(),
                 if_key{"isolated",
                        require_type<bool>("'isolated' must be a boolean"),
                        put_into{ret.isolated}},
                 required_key{"units",
                              "A 'units' array is required",
                              require_array{"'units' must be an array"},
                              for_each{put_into(std::back_inserter(ret.units),
                                                unit_from_data{base_dir})}},
                 if_key{"_comment", just_accept},
                 dym.rejecter<e_bad_config_key>(),
             });
        modsel_log(debug, "Loaded {} configuration unit(s)", ret.units.size());
        return ret;
    }
    modsel_leaf_catch(catch_<semester::walk_error> e)->noreturn_t {
        BOOST_LEAF_THROW_EXCEPTION(e.matched,
                                   errc::invalid_configuration,
                                   e_invalid_config_data{e.matched.what()});
    };
}

evaluation modsel::load_evaluation(const fs::path& yaml_path) {
    MODSEL_E_SCOPE(e_config_file_path{yaml_path});
    auto yml  = modsel::parse_yaml_file(yaml_path);
    auto data = modsel::yaml_as_json5_data(yml);
    return evaluation_from_data(data, yaml_path.parent_path());
}
