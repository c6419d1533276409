#include "./debate.hpp"

#include "./enum.hpp"

#include <boost/leaf/handle_errors.hpp>
#include <catch2/catch.hpp>

namespace {

enum class verbosity {
    quiet,
    normal,
    very_loud,
};

}  // namespace

TEST_CASE("Options and positionals") {
    verbosity   level = verbosity::normal;
    std::string file;
    bool        dry_run = false;

    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .long_spellings  = {"verbosity"},
        .short_spellings = {"v"},
        .help            = "How much to print",
        .valname         = "<level>",
        .action          = debate::put_into(level),
    });
    parser.add_argument(debate::argument{
        .long_spellings = {"dry-run"},
        .nargs          = 0,
        .action         = debate::store_true(dry_run),
    });
    parser.add_argument(debate::argument{
        .help     = "A file to read",
        .valname  = "<file>",
        .required = true,
        .action   = debate::put_into(file),
    });

    parser.parse_argv({"--verbosity=quiet", "a.yaml"});
    CHECK(level == verbosity::quiet);
    CHECK(file == "a.yaml");
    parser.parse_argv({"--verbosity", "very-loud", "b.yaml"});
    CHECK(level == verbosity::very_loud);
    parser.parse_argv({"-vnormal", "c.yaml", "--dry-run"});
    CHECK(level == verbosity::normal);
    CHECK(dry_run);
    CHECK(file == "c.yaml");
    parser.parse_argv({"-v", "quiet", "--", "--file-with-dashes"});
    CHECK(file == "--file-with-dashes");

    CHECK_THROWS_AS(parser.parse_argv({"-vquiet", "--verbosity=normal", "x"}),
                    debate::invalid_repetition);
    CHECK_THROWS_AS(parser.parse_argv({"--verbosity=loud", "x"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--dry-run=yes", "x"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--verbosity"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--dry-run"}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"x", "y"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"--help"}), debate::help_request);
}

TEST_CASE("Subcommands") {
    std::string_view subcommand;
    std::string      kind;
    std::string      out;

    debate::argument_parser parser{"A tool"};
    parser.add_argument({
        .long_spellings = {"out"},
        .valname        = "<path>",
        .action         = debate::put_into(out),
    });
    auto& grp = parser.add_subparsers();
    auto& parse_parser
        = grp.add_parser(debate::subparser{.name   = "parse",
                                           .help   = "Parse a file",
                                           .action = debate::store_value(subcommand, "parse")});
    parse_parser.add_argument({
        .valname  = "<kind>",
        .required = true,
        .action   = debate::put_into(kind),
    });

    parser.parse_argv({"parse", "mod"});
    CHECK(subcommand == "parse");
    CHECK(kind == "mod");

    // Options of a parent parser are accepted after the subcommand
    parser.parse_argv({"parse", "sum", "--out=result.json"});
    CHECK(kind == "sum");
    CHECK(out == "result.json");

    CHECK_THROWS_AS(parser.parse_argv({"--out=x"}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"parse"}), debate::missing_required);

    auto usage = boost::leaf::try_catch(
        [&] {
            parser.parse_argv({"parse", "--bogus"});
            return std::string();
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell) {
            CHECK(spell.value == "--bogus");
            return p.value.usage_string("modsel");
        });
    CHECK(usage == "Usage: modsel parse <kind>");
}
