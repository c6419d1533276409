#include "./engine.hpp"

#include "./table.hpp"

#include <modsel/modsel.test.hpp>
#include <modsel/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

using modsel::errc;
using modsel::module_decl;
using modsel::unit;

namespace {

class memory_files : public modsel::file_source {
public:
    std::map<fs::path, std::string> files;

    std::string read(const fs::path& path) const override {
        auto found = files.find(path);
        if (found == files.end()) {
            BOOST_LEAF_THROW_EXCEPTION(std::system_error(std::make_error_code(
                                           std::errc::no_such_file_or_directory)),
                                       modsel::e_read_file_path{path});
        }
        return found->second;
    }

    std::optional<std::string> read_if_exists(const fs::path& path) const override {
        auto found = files.find(path);
        if (found == files.end()) {
            return std::nullopt;
        }
        return found->second;
    }
};

modsel::from_file_decl go_mod(fs::path p) { return modsel::from_file_decl{.go_mod = p}; }
modsel::from_file_decl go_work(fs::path p) { return modsel::from_file_decl{.go_work = p}; }

module_decl decl(std::string path, std::string version, bool indirect = false) {
    return module_decl{
        .path     = path,
        .version  = version,
        .sum      = "h1:" + path + "@" + version + "=",
        .indirect = indirect,
    };
}

bool has_notice(const modsel::resolution& res, errc code) {
    return std::ranges::any_of(res.notices, [&](auto& d) { return d.code == code; });
}

}  // namespace

TEST_CASE("Selected versions are the highest across units") {
    memory_files files;
    files.files["/root/go.mod"] = R"(
module example.com/root
go 1.21
require example.com/x v1.0.0
)";
    files.files["/root/go.sum"] = "example.com/x v1.0.0 h1:x100=\n";
    files.files["/b/go.mod"]    = R"(
module example.com/b
go 1.21
require example.com/x v1.2.0 // indirect
)";
    files.files["/b/go.sum"] = "example.com/x v1.2.0 h1:x120=\nexample.com/x v1.2.0/go.mod h1:m=\n";

    modsel::evaluation eval{.units = {
                                unit{.name = "root", .is_root = true, .from_file = {go_mod("/root/go.mod")}},
                                unit{.name = "b", .from_file = {go_mod("/b/go.mod")}},
                            }};
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval, files));

    REQUIRE(res.modules.contains("example.com/x"));
    auto& x = res.modules.at("example.com/x");
    CHECK(x.raw_version == "1.2.0");
    CHECK(x.sum == "h1:x120=");
    CHECK(x.source == modsel::module_source::fetched);
    CHECK(x.repo_name == "com_example_x");

    // The requirements come from different units, so they don't conflict. The root's request is
    // stale, though.
    CHECK_FALSE(has_notice(res, errc::version_conflict));
    REQUIRE(res.notices.size() == 1);
    CHECK(res.notices[0].code == errc::stale_direct_dependency);
    CHECK(res.notices[0].message
          == "For Go module \"example.com/x\", the root module requires module version v1.0.0, "
             "but got v1.2.0 in the resolved dependency graph.");

    CHECK(res.root_direct_deps == std::set<std::string>{"com_example_x"});
    CHECK(res.root_direct_dev_deps.empty());

    // The non-root unit provides its own module
    REQUIRE(res.modules.contains("example.com/b"));
    CHECK(res.modules.at("example.com/b").source == modsel::module_source::external);
    CHECK(res.modules.at("example.com/b").provider == "b");
}

TEST_CASE("Staleness can be made fatal") {
    modsel::evaluation eval{
        .units = {
            unit{.name    = "root",
                 .is_root = true,
                 .config  = modsel::unit_config{.check_direct_dependencies
                                               = modsel::strictness::error},
                 .modules = {decl("example.com/x", "v1.0.0")}},
            unit{.name = "other", .modules = {decl("example.com/x", "v1.3.0", true)}},
        }};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.code == errc::stale_direct_dependency);
    REQUIRE(err.diagnostics.size() == 1);
    CHECK(err.diagnostics[0].module_path == "example.com/x");
}

TEST_CASE("Selection does not depend on declaration order") {
    std::vector<unit> units = {
        unit{.name = "a", .modules = {decl("m.com/one", "v1.2.0"), decl("m.com/two", "v0.1.0")}},
        unit{.name    = "b",
             .modules = {decl("m.com/one", "v1.10.0"), decl("m.com/three", "v2.0.0-rc.1")}},
        unit{.name    = "c",
             .modules = {decl("m.com/two", "v0.1.1"),
                         decl("m.com/three", "v2.0.0"),
                         decl("m.com/one", "v1.9.9")}},
    };
    auto by_name = [](const unit& l, const unit& r) { return l.name < r.name; };
    std::ranges::sort(units, by_name);

    std::optional<std::map<std::string, std::string>> first;
    do {
        auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve({.units = units}, memory_files{}));
        std::map<std::string, std::string> selected;
        for (auto& [path, mod] : res.modules) {
            selected[path] = mod.raw_version;
        }
        if (!first) {
            first = selected;
        }
        CHECK(selected == *first);
    } while (std::ranges::next_permutation(units, by_name).found);

    CHECK(first->at("m.com/one") == "1.10.0");
    CHECK(first->at("m.com/two") == "0.1.1");
    CHECK(first->at("m.com/three") == "2.0.0");
}

TEST_CASE("Replace directives are guarded by their source version") {
    auto eval_with = [](memory_files& files, std::string_view from_version) {
        files.files["/root/go.mod"] = "module example.com/root\n"
                                      "go 1.20\n"
                                      "require example.com/p v1.2.0\n"
                                      "replace example.com/p "
            + std::string(from_version) + " => example.com/q v2.0.0\n";
        files.files["/root/go.sum"] = "example.com/p v1.2.0 h1:p=\n"
                                      "example.com/q v2.0.0 h1:q=\n";
        return modsel::evaluation{
            .units = {unit{.name = "root", .is_root = true, .from_file = {go_mod("/root/go.mod")}}}};
    };

    memory_files files;
    auto         res = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval_with(files, "v1.3.0"), files));
    auto&        p   = res.modules.at("example.com/p");
    CHECK(p.raw_version == "1.2.0");
    CHECK_FALSE(p.replace);
    CHECK(p.sum == "h1:p=");

    res     = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval_with(files, "v1.2.0"), files));
    auto& q = res.modules.at("example.com/p");
    CHECK(q.raw_version == "2.0.0");
    CHECK(q.replace == "example.com/q");
    CHECK(q.source == modsel::module_source::replaced);
    CHECK(q.sum == "h1:q=");
    // The root no longer requires the original module, so there is nothing to be stale
    CHECK(res.notices.empty());
}

TEST_CASE("Local replacements need no checksum") {
    memory_files files;
    files.files["/root/go.mod"] = R"(
module example.com/root
go 1.21
require example.com/lib v0.3.0
replace example.com/lib => ./lib
)";
    files.files["/root/go.sum"] = "";
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(
        {.units = {unit{.name = "root", .is_root = true, .from_file = {go_mod("/root/go.mod")}}}},
        files));
    auto& lib = res.modules.at("example.com/lib");
    CHECK(lib.source == modsel::module_source::local);
    CHECK(lib.local_dir == "./lib");
    CHECK(lib.version == modsel::module_version::highest());
    CHECK(lib.sum.empty());
    CHECK(res.notices.empty());
}

TEST_CASE("Conflicting versions within one unit") {
    memory_files files;
    files.files["/root/go.mod"] = R"(
module example.com/root
go 1.21
require example.com/x v1.0.0
)";
    files.files["/root/go.sum"] = "example.com/x v1.0.0 h1:x1=\n";

    auto make_eval = [](modsel::strictness conflicts) {
        return modsel::evaluation{
            .units = {unit{.name      = "root",
                           .is_root   = true,
                           .config    = modsel::unit_config{.check_direct_dependencies
                                                         = modsel::strictness::off,
                                                         .version_conflicts = conflicts},
                           .from_file = {go_mod("/root/go.mod")},
                           .modules   = {decl("example.com/x", "v2.0.0")}}}};
    };

    auto err = modsel::testing::capture_error(
        [&] { return modsel::resolve(make_eval(modsel::strictness::error), files); });
    CHECK(err.code == errc::version_conflict);
    REQUIRE(err.diagnostics.size() == 1);
    auto& diag = err.diagnostics[0];
    CHECK(diag.klass() == modsel::error_class::conflict);
    CHECK(diag.message
          == "Multiple versions of example.com/x found:\n"
             " - /root/go.mod contains: v1.0.0\n"
             " - unit \"root\" contains v2.0.0.");
    CHECK(diag.remediation.starts_with("To correct this:\n 1. manually update"));

    // When demoted, the higher version is used
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(make_eval(modsel::strictness::off), files));
    CHECK(res.modules.at("example.com/x").raw_version == "2.0.0");
    CHECK(has_notice(res, errc::version_conflict));
}

TEST_CASE("Conflicts with no known remedy are always fatal") {
    memory_files files;
    files.files["/root/go.mod"] = "module example.com/root\ngo 1.21\nrequire example.com/x v1.1.0\n";
    files.files["/root/go.sum"] = "example.com/x v1.1.0 h1:x=\n";
    modsel::evaluation eval{
        .units = {unit{.name      = "root",
                       .is_root   = true,
                       .config    = modsel::unit_config{.version_conflicts
                                                     = modsel::strictness::off},
                       .from_file = {go_mod("/root/go.mod")},
                       .modules   = {decl("example.com/x", "v1.2.0")}}}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, files); });
    CHECK(err.code == errc::version_conflict);
}

TEST_CASE("Indirect and declared conflicts get distinct remedies") {
    modsel::evaluation eval{
        .units = {unit{.name    = "root",
                       .is_root = true,
                       .modules = {decl("example.com/x", "v1.0.0"),
                                   decl("example.com/x", "v1.1.0"),
                                   decl("example.com/y", "v1.0.0"),
                                   decl("example.com/y", "v1.4.0", true)}}}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    REQUIRE(err.diagnostics.size() == 2);
    CHECK(err.diagnostics[0].remediation == "To correct this, run:\n 1. go work sync.");
    CHECK(err.diagnostics[1].remediation.starts_with(
        "To correct this:\n 1. update the go.mod file that requires 'example.com/y' indirectly."));
}

TEST_CASE("Workspaces") {
    memory_files files;
    files.files["/ws/go.work"] = R"(
go 1.21
use (
    ./a
    ./b
)
replace example.com/old => example.com/new v1.4.0
)";
    files.files["/ws/go.work.sum"] = "example.com/new v1.4.0 h1:new=\n";
    files.files["/ws/a/go.mod"]    = "module example.com/a\ngo 1.21\nrequire example.com/x v1.0.0\n";
    files.files["/ws/a/go.sum"]    = "example.com/x v1.0.0 h1:x=\n";
    files.files["/ws/b/go.mod"]    = "module example.com/b\ngo 1.21\n";

    modsel::evaluation eval{
        .units = {unit{.name = "root", .is_root = true, .from_file = {go_work("/ws/go.work")}}}};
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval, files));
    CHECK(res.modules.at("example.com/x").raw_version == "1.0.0");
    CHECK(res.modules.at("example.com/new").sum == "h1:new=");
    CHECK(res.root_direct_deps
          == std::set<std::string>{"com_example_new", "com_example_x"});

    // Every requirement reached through the workspace traces to it, so conflicts need a manual fix
    files.files["/ws/b/go.mod"] = "module example.com/b\ngo 1.21\nrequire example.com/x v1.1.0\n";
    files.files["/ws/b/go.sum"] = "example.com/x v1.1.0 h1:x11=\n";
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, files); });
    CHECK(err.code == errc::version_conflict);
    REQUIRE(err.diagnostics.size() == 1);
    CHECK(err.diagnostics[0].message
          == "Multiple versions of example.com/x found:\n"
             " - /ws/b/go.mod contains: v1.1.0\n"
             " - /ws/a/go.mod contains v1.0.0.");
    CHECK(err.diagnostics[0].remediation.find("go work sync") != std::string::npos);
}

TEST_CASE("Only the root unit may use a workspace") {
    modsel::evaluation eval{.units = {unit{.name = "dep", .from_file = {go_work("/ws/go.work")}}}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.code == errc::invalid_configuration);
    CHECK(err.message
          == "from_file(go_work = '/ws/go.work') can only be used from the root unit, but 'dep' "
             "is not the root unit.");

    eval = {.units = {unit{.name = "root", .is_root = true, .from_file = {go_mod("/x/deps.mod")}}}};
    err  = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.message == "go_mod must reference a file named 'go.mod', but got '/x/deps.mod'");
}

TEST_CASE("Manifests must record all transitive requirements") {
    memory_files files;
    files.files["/root/go.mod"] = "module example.com/root\ngo 1.16\n";
    auto err = modsel::testing::capture_error([&] {
        return modsel::resolve({.units = {unit{.name      = "root",
                                               .is_root   = true,
                                               .from_file = {go_mod("/root/go.mod")}}}},
                               files);
    });
    CHECK(err.code == errc::outdated_manifest);
}

TEST_CASE("External providers") {
    memory_files files;
    files.files["/dep/go.mod"] = "module example.com/dep\ngo 1.21\n";

    auto make_eval = [](std::string required, std::string provided = "1.5.0") {
        return modsel::evaluation{
            .units = {
                unit{.name = "root", .is_root = true, .modules = {decl("example.com/dep", required)}},
                unit{.name = "dep", .version = provided, .from_file = {go_mod("/dep/go.mod")}},
            }};
    };

    auto  res = REQUIRES_LEAF_NOFAIL(modsel::resolve(make_eval("v1.4.0"), files));
    auto& dep = res.modules.at("example.com/dep");
    CHECK(dep.source == modsel::module_source::external);
    CHECK(dep.provider == "dep");
    CHECK(dep.raw_version == "1.5.0");
    // Externally provided modules are not direct dependencies
    CHECK(res.root_direct_deps.empty());
    // The provider lifted the root's request, which is still reported
    REQUIRE(res.notices.size() == 1);
    CHECK(res.notices[0].code == errc::stale_direct_dependency);
    CHECK(res.notices[0].module_path == "example.com/dep");
    CHECK(res.notices[0].message
          == "For Go module \"example.com/dep\", the root module requires module version v1.4.0, "
             "but got v1.5.0 in the resolved dependency graph.");

    // An unversioned provider has no version to compare against
    res = REQUIRES_LEAF_NOFAIL(modsel::resolve(make_eval("v1.4.0", ""), files));
    CHECK(res.modules.at("example.com/dep").source == modsel::module_source::external);
    CHECK(res.notices.empty());

    res = REQUIRES_LEAF_NOFAIL(modsel::resolve(make_eval("v1.6.0"), files));
    CHECK(res.modules.at("example.com/dep").source == modsel::module_source::fetched);
    REQUIRE(res.notices.size() == 1);
    CHECK(res.notices[0].code == errc::outdated_external_provider);
    CHECK(res.notices[0].message
          == "Go module \"example.com/dep\" is provided by unit \"dep\" in version 1.5.0, but "
             "requested at higher version 1.6.0 via Go requirements.");
    CHECK(res.root_direct_deps == std::set<std::string>{"com_example_dep"});
}

TEST_CASE("Staleness through an external provider can be made fatal") {
    memory_files files;
    files.files["/dep/go.mod"] = "module example.com/dep\ngo 1.21\n";
    modsel::evaluation eval{
        .units = {
            unit{.name    = "root",
                 .is_root = true,
                 .config  = modsel::unit_config{.check_direct_dependencies
                                               = modsel::strictness::error},
                 .modules = {decl("example.com/dep", "v1.4.0")}},
            unit{.name = "dep", .version = "1.5.0", .from_file = {go_mod("/dep/go.mod")}},
        }};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, files); });
    CHECK(err.code == errc::stale_direct_dependency);
    REQUIRE(err.diagnostics.size() == 1);
    CHECK(err.diagnostics[0].module_path == "example.com/dep");
}

TEST_CASE("Overrides") {
    modsel::evaluation eval{
        .units = {unit{
            .name      = "root",
            .is_root   = true,
            .modules   = {decl("example.com/a", "v1.0.0")},
            .overrides = {modsel::archive_override{.path = "example.com/a",
                                                   .urls = {"https://example.com/a.zip"}},
                          modsel::archive_override{.path = "example.com/missing"}},
        }}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.code == errc::dangling_override);
    REQUIRE(err.diagnostics.size() == 1);
    CHECK(err.diagnostics[0].message
          == "Some archive_overrides did not target a Go module with a matching path: "
             "example.com/missing");

    eval.units[0].overrides.pop_back();
    eval.units[0].modules[0].sum.clear();
    // Archive overrides provide their own source, so no checksum is needed
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval, memory_files{}));
    CHECK(res.modules.at("example.com/a").sum.empty());

    eval.units.push_back(
        unit{.name = "other", .overrides = {modsel::patch_override{.path = "example.com/a"}}});
    err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.code == errc::forbidden_override);
}

TEST_CASE("Integrity problems are reported together") {
    memory_files files;
    files.files["/root/go.mod"] = R"(
module example.com/root
go 1.21
require (
    example.com/a v1.0.0
    example.com/b v1.0.0
)
)";
    files.files["/root/go.sum"] = "example.com/a v1.0.0 h1:good=\n";
    modsel::evaluation eval{
        .units = {unit{.name      = "root",
                       .is_root   = true,
                       .from_file = {go_mod("/root/go.mod")},
                       .modules   = {module_decl{.path    = "example.com/a",
                                                 .version = "v1.0.0",
                                                 .sum     = "h1:evil="}}}}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, files); });
    CHECK(err.code == errc::checksum_mismatch);
    REQUIRE(err.diagnostics.size() == 2);
    CHECK(err.diagnostics[0].code == errc::checksum_mismatch);
    CHECK(err.diagnostics[1].code == errc::missing_checksum);
    CHECK(err.diagnostics[1].message == "No sum for example.com/b@1.0.0 found");
}

TEST_CASE("Invalid requirement versions") {
    modsel::evaluation eval{
        .units = {unit{.name = "root", .is_root = true, .modules = {decl("example.com/a", "latest")}}}};
    auto err = modsel::testing::capture_error([&] { return modsel::resolve(eval, memory_files{}); });
    CHECK(err.code == errc::invalid_version);
    CHECK(err.message
          == "Invalid version \"latest\" for Go module \"example.com/a\" required by unit \"root\"");
}

TEST_CASE("Dev dependencies") {
    modsel::evaluation eval{.units = {unit{
                                .name    = "root",
                                .is_root = true,
                                .modules = {
                                    module_decl{.path           = "example.com/test",
                                                .version        = "v1.0.0",
                                                .sum            = "h1:t=",
                                                .dev_dependency = true},
                                    module_decl{.path           = "example.com/both",
                                                .version        = "v1.0.0",
                                                .sum            = "h1:b=",
                                                .dev_dependency = true},
                                    module_decl{.path = "example.com/both", .version = "v1.0.0"},
                                },
                            }}};
    auto res = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval, memory_files{}));
    CHECK(res.root_direct_deps == std::set<std::string>{"com_example_both"});
    CHECK(res.root_direct_dev_deps == std::set<std::string>{"com_example_test"});
}

TEST_CASE("Resolve the project fixture") {
    auto dir = modsel::testing::DATA_DIR / "project";
    modsel::evaluation eval{
        .units = {unit{.name      = "root",
                       .is_root   = true,
                       .from_file = {go_mod(dir / "go.mod")}}}};
    auto res   = REQUIRES_LEAF_NOFAIL(modsel::resolve(eval, modsel::disk_file_source{}));
    auto table = modsel::build_table(res);
    CHECK(table.repositories.size() == res.modules.size());
    for (auto& ent : table.repositories) {
        INFO("Repository: " << ent.name);
        CHECK(ent.sum.has_value());
        CHECK(ent.version.has_value());
    }
}
