#include "./tokenize.hpp"

#include <modsel/modsel.test.hpp>

#include <catch2/catch.hpp>

using tokens = std::vector<std::string>;

#define CHECK_TOKENIZE(line, ...)                                                                  \
    do {                                                                                           \
        auto toks = REQUIRES_LEAF_NOFAIL(modsel::tokenize_line(line));                             \
        CHECK(toks.tokens == tokens(__VA_ARGS__));                                                 \
    } while (0)

TEST_CASE("Tokenize bare words") {
    CHECK_TOKENIZE("", {});
    CHECK_TOKENIZE("   ", {});
    CHECK_TOKENIZE("require", {"require"});
    CHECK_TOKENIZE("require example.com/mod v1.2.3", {"require", "example.com/mod", "v1.2.3"});
    CHECK_TOKENIZE("  a   b  ", {"a", "b"});
    CHECK_TOKENIZE("foo//bar", {"foo//bar"});
}

TEST_CASE("Tokenize quoted strings") {
    CHECK_TOKENIZE("module `example.com/my mod`", {"module", "example.com/my mod"});
    CHECK_TOKENIZE(R"(module "example.com/mod")", {"module", "example.com/mod"});
    CHECK_TOKENIZE(R"("a\"b" c)", {"a\"b", "c"});
    CHECK_TOKENIZE(R"("a\\b")", {"a\\b"});
    CHECK_TOKENIZE(R"(`a\"b`)", {"a\\\"b"});
    CHECK_TOKENIZE(R"("" x)", {"", "x"});
}

TEST_CASE("Comments are returned separately") {
    auto toks = REQUIRES_LEAF_NOFAIL(modsel::tokenize_line("golang.org/x/sys v0.15.0 // indirect"));
    CHECK(toks.tokens == tokens{"golang.org/x/sys", "v0.15.0"});
    CHECK(toks.comment == "indirect");

    toks = REQUIRES_LEAF_NOFAIL(modsel::tokenize_line("// just a comment"));
    CHECK(toks.tokens.empty());
    CHECK(toks.comment == "just a comment");

    toks = REQUIRES_LEAF_NOFAIL(modsel::tokenize_line(R"("// not a comment" x)"));
    CHECK(toks.tokens == tokens{"// not a comment", "x"});
    CHECK_FALSE(toks.comment.has_value());
}

TEST_CASE("Unterminated strings are errors") {
    auto err = modsel::testing::capture_error([] { return modsel::tokenize_line("module `foo"); });
    CHECK(err.code == modsel::errc::manifest_parse);
    CHECK(err.message == "unterminated raw string");

    err = modsel::testing::capture_error([] { return modsel::tokenize_line(R"(module "foo\")"); });
    CHECK(err.message == "unterminated interpreted string");
}

TEST_CASE("Normalize whitespace") {
    CHECK(modsel::normalize_whitespace("a\tb\r\nc") == "a b \nc");
}
