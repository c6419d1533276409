#include "./manifest.hpp"

#include <modsel/modsel.test.hpp>
#include <modsel/util/fs/io.hpp>

#include <catch2/catch.hpp>

namespace {

modsel::manifest parse_ok(std::string_view content) {
    return REQUIRES_LEAF_NOFAIL(modsel::parse_manifest(content, "go.mod"));
}

}  // namespace

TEST_CASE("Parse a simple manifest") {
    auto man = parse_ok(R"(
module example.com/app

go 1.21.3

require (
	github.com/pkg/errors v0.9.1
	golang.org/x/sys v0.15.0 // indirect
)

require github.com/google/uuid v1.3.0
exclude github.com/bad/mod v1.0.0
retract v0.1.0
toolchain go1.21.4
)");
    CHECK(man.module_path == "example.com/app");
    CHECK(man.lang_version == modsel::lang_version{1, 21});
    REQUIRE(man.requirements.size() == 3);
    CHECK(man.requirements[0].path == "github.com/pkg/errors");
    CHECK(man.requirements[0].version == "v0.9.1");
    CHECK_FALSE(man.requirements[0].indirect);
    CHECK(man.requirements[1].path == "golang.org/x/sys");
    CHECK(man.requirements[1].indirect);
    CHECK(man.requirements[1].line == 8);
    CHECK(man.requirements[2].path == "github.com/google/uuid");
    CHECK(man.replaces.empty());
}

TEST_CASE("A missing go directive defaults to 1.16") {
    auto man = parse_ok("module example.com/app\n");
    CHECK(man.lang_version == modsel::lang_version{1, 16});
    auto err = modsel::testing::capture_error(
        [&] { return modsel::require_transitive_manifest(man, "go.mod"); });
    CHECK(err.code == modsel::errc::outdated_manifest);
}

TEST_CASE("Transitive manifests need language version 1.17 or newer") {
    auto lang = GENERATE(as<std::string>{}, "1.17", "1.21.3", "2.0");
    CAPTURE(lang);
    auto man = parse_ok("module example.com/app\ngo " + lang + "\n");
    REQUIRES_LEAF_NOFAIL(modsel::require_transitive_manifest(man, "go.mod"));
}

TEST_CASE("Replace directive shapes") {
    auto man = parse_ok(R"(
module example.com/app
go 1.19
replace a.com/x => b.com/x v1.2.0
replace a.com/y v1.0.0 => b.com/y v2.0.0
replace (
    a.com/z => ../z/
    a.com/w v0.1.0 => ./w
)
)");
    REQUIRE(man.replaces.size() == 4);

    auto x = man.replaces.find("a.com/x");
    REQUIRE(x);
    CHECK_FALSE(x->from_version);
    CHECK(x->to_path == "b.com/x");
    CHECK(x->to_version == "1.2.0");
    CHECK(x->changes_path());

    auto y = man.replaces.find("a.com/y");
    REQUIRE(y);
    CHECK(y->from_version == "1.0.0");
    CHECK(y->to_version == "2.0.0");

    auto z = man.replaces.find("a.com/z");
    REQUIRE(z);
    CHECK(z->is_local());
    CHECK(z->local_dir == "../z/");
    CHECK(z->to_path == "a.com/z");
    CHECK_FALSE(z->to_version);

    auto w = man.replaces.find("a.com/w");
    REQUIRE(w);
    CHECK(w->from_version == "0.1.0");
    CHECK(w->local_dir == "./w");
}

TEST_CASE("Later replace entries overwrite earlier ones") {
    auto man = parse_ok(R"(
module example.com/app
replace a.com/x => b.com/x v1.0.0
replace a.com/x => c.com/x v2.0.0
)");
    REQUIRE(man.replaces.size() == 1);
    CHECK(man.replaces.find("a.com/x")->to_path == "c.com/x");
}

TEST_CASE("Parsing is deterministic") {
    auto content = modsel::read_file(modsel::testing::DATA_DIR / "manifests/app/go.mod");
    auto one     = parse_ok(content);
    auto two     = parse_ok(content);
    CHECK(one == two);
    CHECK(one.module_path == "example.com/app");
    CHECK(one.requirements.size() == 10);
    CHECK(one.replaces.size() == 2);
}

TEST_CASE("Manifest parse errors") {
    struct case_ {
        std::string_view content;
        std::string_view message;
        int              line;
    };

    case_ cases[] = {
        {"module a\nfrobnicate x", "unexpected token 'frobnicate' at start of line", 2},
        {"module a\nrequire", "expected another token after 'require'", 2},
        {"module a\ngo 1.17\ngo 1.18", "unexpected second 'go' directive", 3},
        {"module a\ngo 1.17 extra", "unexpected token 'extra' after '1.17'", 2},
        {"module a\nrequire ( x", "unexpected token 'x' after '('", 2},
        {"module a\nrequire (\n) y", "unexpected token 'y' after ')'", 3},
        {"module a\nrequire x", "expected module path and version in 'require' directive", 2},
        {"module a\nrequire (\nx v1 v2\n)",
         "expected module path and version in 'require' directive",
         3},
        {"module a\nmodule b", "unexpected second 'module' directive", 2},
        {"module a\n)", "unexpected token ')' at start of line", 2},
        {"module `a", "unterminated raw string", 1},
        {"module a\ngo banana", "invalid language version 'banana'", 2},
        {"module a\nreplace x y", "invalid 'replace' directive for 'x': expected 'path [version] "
                                  "=> path [version]'",
         2},
        {"module a\nrequire (\nx v1.0.0\n", "unterminated 'require' block", 2},
    };

    for (auto [content, message, line] : cases) {
        INFO("Parsing manifest: " << content);
        auto err = modsel::testing::capture_error(
            [&] { return modsel::parse_manifest(content, "bad/go.mod"); });
        CHECK(err.code == modsel::errc::manifest_parse);
        CHECK(err.message == message);
        CHECK(err.line == line);
        CHECK(err.file == std::filesystem::path("bad/go.mod"));
    }

    auto err = modsel::testing::capture_error(
        [&] { return modsel::parse_manifest("go 1.21\n", "go.mod"); });
    CHECK(err.message == "expected a module directive in the manifest");
}
