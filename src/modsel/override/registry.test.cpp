#include "./registry.hpp"

#include <modsel/modsel.test.hpp>

#include <catch2/catch.hpp>

#include <set>

using modsel::archive_override;
using modsel::build_override;
using modsel::patch_override;

TEST_CASE("Register overrides from the root unit") {
    modsel::override_registry reg;
    REQUIRES_LEAF_NOFAIL(reg.add_from_unit(
        "root",
        true,
        {
            archive_override{.path = "example.com/a", .urls = {"https://example.com/a.zip"}},
            build_override{.path = "example.com/a", .directives = {"gazelle:proto disable"}},
            patch_override{.path = "example.com/b", .patches = {"//:b.patch"}, .patch_strip = 1},
        }));
    REQUIRE(reg.find_archive("example.com/a"));
    CHECK(reg.find_archive("example.com/a")->urls.size() == 1);
    REQUIRE(reg.find_build("example.com/a"));
    CHECK(reg.find_patch("example.com/a") == nullptr);
    REQUIRE(reg.find_patch("example.com/b"));
    CHECK(reg.targets("example.com/a"));
    CHECK(reg.targets("example.com/b"));
    CHECK_FALSE(reg.targets("example.com/c"));
}

TEST_CASE("Non-root units may not declare overrides") {
    modsel::override_registry reg;
    auto err = modsel::testing::capture_error([&] {
        return reg.add_from_unit("other", false, {patch_override{.path = "example.com/a"}});
    });
    CHECK(err.code == modsel::errc::forbidden_override);
    CHECK(err.message
          == "Declaring module_overrides in a non-root unit is forbidden, but unit \"other\" "
             "declares them.");

    // An isolated evaluation makes the unit privileged
    REQUIRES_LEAF_NOFAIL(
        reg.add_from_unit("other", true, {patch_override{.path = "example.com/a"}}));
    // Declaring nothing is always allowed
    REQUIRES_LEAF_NOFAIL(reg.add_from_unit("third", false, {}));
}

TEST_CASE("Duplicate and conflicting overrides") {
    modsel::override_registry reg;
    auto err = modsel::testing::capture_error([&] {
        return reg.add_from_unit("root",
                                 true,
                                 {
                                     build_override{.path = "example.com/a"},
                                     build_override{.path = "example.com/a"},
                                 });
    });
    CHECK(err.code == modsel::errc::duplicate_override);
    CHECK(err.message
          == "Multiple overrides defined for Go module path \"example.com/a\" in module \"root\".");

    modsel::override_registry reg2;
    err = modsel::testing::capture_error([&] {
        return reg2.add_from_unit("root",
                                  true,
                                  {
                                      patch_override{.path = "example.com/a"},
                                      archive_override{.path = "example.com/a"},
                                  });
    });
    CHECK(err.code == modsel::errc::conflicting_override);
    CHECK(err.message
          == "Go module path \"example.com/a\" in module \"root\" is the target of both "
             "module_overrides and archive_overrides.");
}

TEST_CASE("Gazelle directives are validated") {
    REQUIRES_LEAF_NOFAIL(modsel::check_directive("gazelle:go_naming_convention import"));
    for (auto bad : {"gazelle:", "proto disable", "gazelle: proto disable", "gazelle:proto"}) {
        INFO("Checking directive: " << bad);
        auto err = modsel::testing::capture_error([&] { return modsel::check_directive(bad); });
        CHECK(err.code == modsel::errc::invalid_directive);
    }

    modsel::override_registry reg;
    auto err = modsel::testing::capture_error([&] {
        return reg.add_from_unit("root",
                                 true,
                                 {build_override{.path = "x", .directives = {"gazelle:bad"}}});
    });
    CHECK(err.message
          == "Invalid Gazelle directive: \"gazelle:bad\". Gazelle directives must be of the form "
             "\"gazelle:key value\".");
}

TEST_CASE("Find directive values") {
    std::vector<std::string> dirs = {
        "gazelle:go_naming_convention import",
        "gazelle:proto disable",
        "gazelle:go_naming_convention go_default_library",
    };
    CHECK(modsel::directive_value(dirs, "go_naming_convention") == "go_default_library");
    CHECK(modsel::directive_value(dirs, "proto") == "disable");
    CHECK_FALSE(modsel::directive_value(dirs, "go_grpc_compilers"));
    CHECK(modsel::patch_args_for(2) == std::vector<std::string>{"-p2"});
}

TEST_CASE("Unmatched overrides are reported in batches") {
    modsel::override_registry reg;
    REQUIRES_LEAF_NOFAIL(reg.add_from_unit("root",
                                           true,
                                           {
                                               archive_override{.path = "a.com/one"},
                                               archive_override{.path = "a.com/two"},
                                               archive_override{.path = "a.com/three"},
                                               build_override{.path = "a.com/one"},
                                               patch_override{.path = "a.com/four"},
                                           }));
    std::set<std::string, std::less<>> resolved = {"a.com/one", "a.com/four"};
    auto problems = reg.unmatched([&](std::string_view p) { return resolved.contains(p); });
    REQUIRE(problems.size() == 1);
    CHECK(problems[0].code == modsel::errc::dangling_override);
    CHECK(problems[0].message
          == "Some archive_overrides did not target a Go module with a matching path: a.com/two, "
             "a.com/three");

    resolved.insert("a.com/two");
    resolved.insert("a.com/three");
    CHECK(reg.unmatched([&](std::string_view p) { return resolved.contains(p); }).empty());
}
