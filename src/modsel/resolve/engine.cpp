#include "./engine.hpp"

#include "./conflict.hpp"
#include "./context.hpp"
#include "./requirement.hpp"
#include "./table.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/result.hpp>
#include <modsel/manifest/error.hpp>
#include <modsel/manifest/manifest.hpp>
#include <modsel/manifest/workspace.hpp>
#include <modsel/util/log.hpp>
#include <modsel/util/string.hpp>

#include <boost/leaf/on_error.hpp>
#include <neo/ufmt.hpp>

using namespace modsel;

namespace fs = std::filesystem;

namespace {

auto config_error(std::string message) {
    return new_error(errc::invalid_configuration,
                     e_human_message{std::move(message)});
}

/**
 * @brief The requirements of a single unit, merged by path
 */
struct unit_state {
    const unit& u;
    // Requirements loaded from files. They are merged after the explicit declarations.
    std::vector<requirement>                         from_files{};
    std::map<std::string, requirement, std::less<>> merged{};
};

result<void> check_units(const evaluation& eval) {
    std::vector<std::string> roots;
    for (auto& u : eval.units) {
        if (u.is_root) {
            roots.push_back(u.name);
        }
    }
    if (roots.size() > 1) {
        return config_error(
            neo::ufmt("Multiple root units declared: {}", joinstr(", ", roots)));
    }
    if (eval.isolated && eval.units.size() > 1) {
        return config_error(neo::ufmt("An isolated evaluation must contain exactly one unit, but "
                                      "{} were given",
                                      eval.units.size()));
    }
    return {};
}

result<void> check_from_file(const unit& u) {
    if (u.from_file.size() > 1) {
        std::vector<std::string> names;
        for (auto& ff : u.from_file) {
            names.push_back(ff.go_mod.value_or(ff.go_work.value_or(fs::path())).string());
        }
        return config_error(neo::ufmt("Multiple from_file declarations defined in unit \"{}\": {}",
                                      u.name,
                                      joinstr(", ", names)));
    }
    for (auto& ff : u.from_file) {
        if (ff.go_mod.has_value() == ff.go_work.has_value()) {
            return config_error(neo::ufmt("A from_file declaration in unit \"{}\" must have either "
                                          "go_mod or go_work, but not both.",
                                          u.name));
        }
        if (ff.go_mod && ff.go_mod->filename() != "go.mod") {
            return config_error(neo::ufmt("go_mod must reference a file named 'go.mod', but got "
                                          "'{}'",
                                          ff.go_mod->string()));
        }
        if (ff.go_work) {
            if (ff.go_work->filename() != "go.work") {
                return config_error(neo::ufmt("go_work must reference a file named 'go.work', but "
                                              "got '{}'",
                                              ff.go_work->string()));
            }
            if (!u.is_root) {
                return config_error(neo::ufmt("from_file(go_work = '{}') can only be used from the "
                                              "root unit, but '{}' is not the root unit.",
                                              ff.go_work->string(),
                                              u.name));
            }
        }
    }
    return {};
}

result<void> load_sums(resolution_context& ctx, const fs::path& sum_path, std::string_view content) {
    BOOST_LEAF_AUTO(entries, parse_sum_file(content, sum_path));
    ctx.defer_all(ctx.sums.insert_all(entries));
    return {};
}

result<void> register_external(resolution_context& ctx, const unit& u, const manifest& man) {
    auto raw = canonicalize_raw_version(u.version);
    auto ver = module_version::highest();
    if (!raw.empty()) {
        MODSEL_E_SCOPE(e_module_path{man.module_path});
        BOOST_LEAF_AUTO(relaxed, parse_relaxed_version(raw));
        ver = relaxed;
    }
    auto it = ctx.externals.find(man.module_path);
    if (it != ctx.externals.end() && !(ver > it->second.version)) {
        return {};
    }
    modsel_log(debug,
               "Unit \"{}\" provides Go module \"{}\" in version {}",
               u.name,
               man.module_path,
               raw.empty() ? std::string("(unversioned)") : raw);
    ctx.externals.insert_or_assign(man.module_path,
                                   external_provider{
                                       .module_path = man.module_path,
                                       .unit_name   = u.name,
                                       .version     = ver,
                                       .raw_version = raw,
                                   });
    return {};
}

result<void> load_manifest(resolution_context&     ctx,
                           unit_state&             st,
                           const fs::path&         go_mod,
                           bool                    dev_dependency,
                           std::optional<fs::path> via_workspace) {
    modsel_log(debug, "Loading manifest {}", go_mod.string());
    auto content = ctx.files.read(go_mod);
    BOOST_LEAF_AUTO(man, parse_manifest(content, go_mod));
    BOOST_LEAF_CHECK(require_transitive_manifest(man, go_mod));

    MODSEL_E_SCOPE(e_parse_file{go_mod});
    for (auto& line : man.requirements) {
        MODSEL_E_SCOPE(e_parse_line{line.line});
        BOOST_LEAF_AUTO(req,
                        requirement::create(line.path,
                                            line.version,
                                            line.indirect,
                                            dev_dependency,
                                            provenance{
                                                .kind          = provenance::manifest,
                                                .unit          = st.u.name,
                                                .file          = go_mod,
                                                .via_workspace = via_workspace,
                                            }));
        st.from_files.push_back(std::move(req));
    }

    if (st.u.is_root || ctx.eval.isolated) {
        ctx.replaces.assign_all(man.replaces);
    } else {
        // Replace directives of other units are not honored. The unit instead participates in
        // resolution as the provider of its own module.
        BOOST_LEAF_CHECK(register_external(ctx, st.u, man));
    }

    if (!man.requirements.empty()) {
        auto sum_path = go_mod.parent_path() / "go.sum";
        BOOST_LEAF_CHECK(load_sums(ctx, sum_path, ctx.files.read(sum_path)));
    }
    return {};
}

result<void> load_workspace(resolution_context& ctx,
                            unit_state&         st,
                            const fs::path&     go_work,
                            bool                dev_dependency) {
    modsel_log(debug, "Loading workspace {}", go_work.string());
    auto content = ctx.files.read(go_work);
    BOOST_LEAF_AUTO(work, parse_workspace(content, go_work));

    // A versioned replacement in the workspace also requires the replacement module
    for (auto& [_, rep] : work.replaces) {
        if (!rep.to_version) {
            continue;
        }
        MODSEL_E_SCOPE(e_parse_file{go_work});
        BOOST_LEAF_AUTO(req,
                        requirement::create(rep.to_path,
                                            *rep.to_version,
                                            false,
                                            false,
                                            provenance{
                                                .kind = provenance::workspace,
                                                .unit = st.u.name,
                                                .file = go_work,
                                            }));
        st.from_files.push_back(std::move(req));
    }

    auto sum_path = go_work.parent_path() / "go.work.sum";
    if (auto sums = ctx.files.read_if_exists(sum_path)) {
        BOOST_LEAF_CHECK(load_sums(ctx, sum_path, *sums));
    }

    ctx.replaces.assign_all(work.replaces);

    for (auto& use : work.uses) {
        BOOST_LEAF_CHECK(load_manifest(ctx, st, use.manifest_path, dev_dependency, go_work));
    }
    return {};
}

/**
 * @brief Merge a requirement into the unit's requirements, checking for a conflict with an
 * earlier requirement on the same path.
 */
void merge_requirement(resolution_context& ctx, unit_state& st, requirement req) {
    if (st.u.is_root && !req.indirect) {
        ctx.root_versions.insert_or_assign(req.path,
                                           root_request{
                                               .raw_version = req.raw_version,
                                               .version     = req.version,
                                           });
        if (req.dev_dependency) {
            ctx.root_direct_dev.insert(req.path);
        } else {
            ctx.root_direct.insert(req.path);
        }
    }

    auto found = st.merged.find(req.path);
    if (found == st.merged.end()) {
        auto key = req.path;
        st.merged.emplace(std::move(key), std::move(req));
        return;
    }

    auto& previous = found->second;
    if (previous.version == req.version) {
        return;
    }

    auto remedy = classify_conflict(previous, req);
    auto diag   = conflict_diagnostic(previous, req, remedy);
    if (remedy) {
        ctx.report(std::move(diag), ctx.config.version_conflicts);
    } else {
        ctx.defer(std::move(diag));
    }
    if (req.version > previous.version) {
        previous = std::move(req);
    }
}

/**
 * @brief Raise the selected version of the requirement's path, if it is higher.
 */
void select_max(resolution_context& ctx, const requirement& req) {
    auto found = ctx.resolved.find(req.path);
    if (found != ctx.resolved.end() && !(req.version > found->second.version)) {
        return;
    }
    ctx.resolved.insert_or_assign(req.path,
                                  resolved_module{
                                      .path        = req.path,
                                      .repo_name   = repo_name(req.path),
                                      .version     = req.version,
                                      .raw_version = req.raw_version,
                                  });
}

result<void> process_unit(resolution_context& ctx, const unit& u) {
    MODSEL_E_SCOPE(e_unit_name{u.name});
    modsel_log(debug, "Processing unit \"{}\"", u.name);
    BOOST_LEAF_CHECK(ctx.overrides.add_from_unit(u.name, u.is_root || ctx.eval.isolated, u.overrides));
    BOOST_LEAF_CHECK(check_from_file(u));

    unit_state st{u};
    for (auto& ff : u.from_file) {
        if (ff.go_mod) {
            BOOST_LEAF_CHECK(load_manifest(ctx, st, *ff.go_mod, ff.dev_dependency, std::nullopt));
        } else {
            BOOST_LEAF_CHECK(load_workspace(ctx, st, *ff.go_work, ff.dev_dependency));
        }
    }

    std::vector<requirement> declared;
    for (auto& mod : u.modules) {
        if (!mod.sum.empty()) {
            if (auto mismatch = ctx.sums.insert(mod.path,
                                                canonicalize_raw_version(mod.version),
                                                mod.sum)) {
                ctx.defer(std::move(*mismatch));
            }
        }
        BOOST_LEAF_AUTO(req,
                        requirement::create(mod.path,
                                            mod.version,
                                            mod.indirect,
                                            mod.dev_dependency,
                                            provenance{.kind = provenance::declaration,
                                                       .unit = u.name}));
        declared.push_back(std::move(req));
    }

    for (auto& req : declared) {
        merge_requirement(ctx, st, std::move(req));
    }
    for (auto& req : st.from_files) {
        merge_requirement(ctx, st, std::move(req));
    }
    for (auto& [_, req] : st.merged) {
        select_max(ctx, req);
    }
    return {};
}

result<void> apply_replaces(resolution_context& ctx) {
    for (auto& [path, rep] : ctx.replaces) {
        auto found = ctx.resolved.find(path);
        if (found == ctx.resolved.end()) {
            continue;
        }
        MODSEL_E_SCOPE(e_module_path{path});
        auto& mod = found->second;
        if (rep.from_version) {
            BOOST_LEAF_AUTO(from, parse_version(*rep.from_version));
            if (mod.version != from) {
                modsel_log(debug,
                           "Replacement of {}@v{} does not apply to the selected version v{}",
                           path,
                           *rep.from_version,
                           mod.raw_version);
                continue;
            }
        }

        if (rep.is_local()) {
            mod.version   = module_version::highest();
            mod.source    = module_source::local;
            mod.local_dir = rep.local_dir;
            mod.replace.reset();
            ctx.root_versions.erase(path);
            continue;
        }

        BOOST_LEAF_AUTO(to, parse_version(*rep.to_version));
        mod.version     = to;
        mod.raw_version = *rep.to_version;
        mod.source      = module_source::replaced;
        if (rep.changes_path()) {
            // Comparing against the original request is meaningless for a different module
            mod.replace = rep.to_path;
            ctx.root_versions.erase(path);
        } else if (auto root = ctx.root_versions.find(path); root != ctx.root_versions.end()) {
            root->second = root_request{.raw_version = mod.raw_version, .version = mod.version};
        }
    }
    return {};
}

void apply_externals(resolution_context& ctx) {
    for (auto& [path, ext] : ctx.externals) {
        // Overrides and replacements can't be applied to an external module, so the Go module
        // is fetched instead
        if (ctx.overrides.targets(path) || ctx.replaces.contains(path)) {
            continue;
        }
        auto found = ctx.resolved.find(path);
        if (found != ctx.resolved.end() && ext.version < found->second.version) {
            ctx.report(
                diagnostic{
                    .code = errc::outdated_external_provider,
                    .message
                    = neo::ufmt("Go module \"{}\" is provided by unit \"{}\" in version {}, but "
                                "requested at higher version {} via Go requirements.",
                                path,
                                ext.unit_name,
                                ext.raw_version,
                                found->second.raw_version),
                    .remediation = neo::ufmt("Consider updating the version of unit \"{}\" to "
                                             "ensure that it is used to provide the Go module.",
                                             ext.unit_name),
                    .module_path = path,
                },
                ctx.config.check_direct_dependencies);
            continue;
        }
        ctx.resolved.insert_or_assign(path,
                                      resolved_module{
                                          .path        = path,
                                          .repo_name   = repo_name(path),
                                          .version     = ext.version,
                                          .raw_version = ext.raw_version,
                                          .source      = module_source::external,
                                          .provider    = ext.unit_name,
                                      });
    }
}

void check_staleness(resolution_context& ctx) {
    for (auto& [path, root] : ctx.root_versions) {
        auto found = ctx.resolved.find(path);
        if (found == ctx.resolved.end()) {
            continue;
        }
        auto& mod = found->second;
        // An unversioned external provider has no meaningful version to suggest
        if (mod.source == module_source::external && mod.version == module_version::highest()) {
            continue;
        }
        if (root.version < mod.version) {
            ctx.report(
                diagnostic{
                    .code        = errc::stale_direct_dependency,
                    .message     = neo::ufmt("For Go module \"{}\", the root module requires "
                                         "module version v{}, but got v{} in the resolved "
                                         "dependency graph.",
                                         path,
                                         root.raw_version,
                                         mod.raw_version),
                    .remediation = neo::ufmt("Update the root module's requirement on \"{}\" to "
                                             "v{}",
                                             path,
                                             mod.raw_version),
                    .module_path = path,
                },
                ctx.config.check_direct_dependencies);
        }
    }
}

void attach_sums(resolution_context& ctx) {
    for (auto& [path, mod] : ctx.resolved) {
        if (mod.source == module_source::external || mod.source == module_source::local
            || ctx.overrides.find_archive(path)) {
            continue;
        }
        auto sum = ctx.sums.lookup(mod.replace.value_or(path), mod.raw_version);
        if (!sum) {
            ctx.defer(diagnostic{
                .code        = errc::missing_checksum,
                .message     = neo::ufmt("No sum for {}@{} found", path, mod.raw_version),
                .remediation = "Run 'go mod tidy' to update the checksum files",
                .module_path = path,
            });
            continue;
        }
        mod.sum = *sum;
    }
}

}  // namespace

result<resolution> modsel::resolve(const evaluation& eval, const file_source& files) {
    BOOST_LEAF_CHECK(check_units(eval));

    resolution_context ctx{.eval = eval, .files = files};
    for (auto& u : eval.units) {
        if (u.is_root && u.config) {
            ctx.config = *u.config;
        }
    }

    for (auto& u : eval.units) {
        BOOST_LEAF_CHECK(process_unit(ctx, u));
    }

    ctx.defer_all(ctx.overrides.unmatched(
        [&](std::string_view path) { return ctx.resolved.contains(path); }));

    BOOST_LEAF_CHECK(apply_replaces(ctx));
    apply_externals(ctx);
    check_staleness(ctx);
    attach_sums(ctx);

    if (!ctx.deferred.empty()) {
        auto first = ctx.deferred.front();
        modsel_log(debug, "Evaluation failed with {} problem(s)", ctx.deferred.size());
        return new_error(first.code,
                         e_human_message{first.message},
                         e_remediation{first.remediation},
                         e_diagnostics{std::move(ctx.deferred)});
    }

    resolution ret;
    for (auto& path : ctx.root_direct) {
        if (ctx.resolved.at(path).source != module_source::external) {
            ret.root_direct_deps.insert(repo_name(path));
        }
    }
    for (auto& path : ctx.root_direct_dev) {
        auto name = repo_name(path);
        // A module that is both a dev and a non-dev dependency is a non-dev dependency
        if (ctx.resolved.at(path).source != module_source::external
            && !ret.root_direct_deps.contains(name)) {
            ret.root_direct_dev_deps.insert(std::move(name));
        }
    }
    ret.modules   = std::move(ctx.resolved);
    ret.overrides = std::move(ctx.overrides);
    ret.notices   = std::move(ctx.notices);
    return ret;
}
