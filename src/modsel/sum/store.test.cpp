#include "./store.hpp"

#include <modsel/modsel.test.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Parse a checksum file") {
    auto entries = REQUIRES_LEAF_NOFAIL(modsel::parse_sum_file("mod v1.2.3 h1:abc=\n", "go.sum"));
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].path == "mod");
    CHECK(entries[0].version == "1.2.3");
    CHECK(entries[0].hash == "h1:abc=");

    entries = REQUIRES_LEAF_NOFAIL(modsel::parse_sum_file(R"(
mod v1.2.3 h1:abc=
mod v1.2.3/go.mod h1:def=

github.com/pkg/errors	v0.9.1	h1:FEBLx1zS214owpjy7qsBeixbURkuhQAwrK5UwLGTwt4=
)",
                                                          "go.sum"));
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].line == 2);
    CHECK(entries[1].path == "github.com/pkg/errors");
    CHECK(entries[1].version == "0.9.1");
    CHECK(entries[1].line == 5);
}

TEST_CASE("Malformed checksum lines") {
    auto err = modsel::testing::capture_error(
        [] { return modsel::parse_sum_file("a v1.0.0 h1:x=\nb v1.0.0\n", "dir/go.sum"); });
    CHECK(err.code == modsel::errc::sum_parse);
    CHECK(err.line == 2);
    CHECK(err.file == std::filesystem::path("dir/go.sum"));
    CHECK(err.message == "expected 'path version hash', but the line has 2 fields");
}

TEST_CASE("Checksum store insertion") {
    modsel::sum_store store;
    CHECK_FALSE(store.insert("mod", "1.2.3", "h1:abc="));
    // Re-inserting the same value is fine
    CHECK_FALSE(store.insert("mod", "1.2.3", "h1:abc="));
    CHECK_FALSE(store.insert("mod", "1.2.4", "h1:xyz="));
    CHECK(store.size() == 2);

    auto mismatch = store.insert("mod", "1.2.3", "h1:evil=");
    REQUIRE(mismatch);
    CHECK(mismatch->code == modsel::errc::checksum_mismatch);
    CHECK(mismatch->klass() == modsel::error_class::integrity);
    CHECK(mismatch->message == "Multiple mismatching sums for mod@1.2.3 found. h1:evil= vs h1:abc=");
    CHECK(mismatch->module_path == "mod");

    // The original value is kept
    REQUIRE(store.lookup("mod", "1.2.3"));
    CHECK(*store.lookup("mod", "1.2.3") == "h1:abc=");
    CHECK(store.lookup("mod", "1.2.5") == nullptr);
    CHECK(store.lookup("other", "1.2.3") == nullptr);
}

TEST_CASE("Insert a whole checksum file") {
    modsel::sum_store store;
    CHECK_FALSE(store.insert("a", "1.0.0", "h1:one="));
    auto entries = REQUIRES_LEAF_NOFAIL(
        modsel::parse_sum_file("a v1.0.0 h1:two=\nb v1.0.0 h1:b=\na v1.0.0/go.mod h1:m=\n",
                               "go.sum"));
    auto problems = store.insert_all(entries);
    REQUIRE(problems.size() == 1);
    CHECK(problems[0].module_path == "a");
    CHECK(store.size() == 2);
}
