#include "./options.hpp"

#include <modsel/util/env.hpp>

#include <debate/argument_parser.hpp>
#include <debate/enum.hpp>
#include <magic_enum.hpp>

using namespace modsel;
using namespace debate;

namespace {

struct setup {
    cli::options& opts;

    argument out_arg{
        .long_spellings  = {"out"},
        .short_spellings = {"o"},
        .help            = "Write the output to the given file instead of stdout",
        .valname         = "<path>",
        .action          = put_into(opts.out_path),
    };

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = put_into(opts.log_level),
        });
        auto& group = parser.add_subparsers({
            .valname     = "<command>",
            .description = "The operation to perform",
        });
        setup_resolve_cmd(group.add_parser({
            .name   = "resolve",
            .help   = "Resolve module versions for an evaluation and print the module table",
            .action = [this] { opts.subcommand = cli::subcommand::resolve; },
        }));
        setup_parse_cmd(group.add_parser({
            .name   = "parse",
            .help   = "Parse a manifest, workspace, or checksum file and print its contents",
            .action = [this] { opts.subcommand = cli::subcommand::parse; },
        }));
    }

    void setup_resolve_cmd(argument_parser& resolve_cmd) noexcept {
        resolve_cmd.add_argument({
            .help     = "The YAML file that describes the evaluation",
            .valname  = "<config-yaml>",
            .required = true,
            .action   = put_into(opts.resolve.config_path),
        });
        resolve_cmd.add_argument(out_arg.dup());
    }

    void setup_parse_cmd(argument_parser& parse_cmd) noexcept {
        parse_cmd.add_argument({
            .help     = "The kind of file to parse",
            .valname  = "{mod,work,sum}",
            .required = true,
            .action   = put_into(opts.parse.kind),
        });
        parse_cmd.add_argument({
            .help     = "The file to parse",
            .valname  = "<file>",
            .required = true,
            .action   = put_into(opts.parse.file),
        });
        parse_cmd.add_argument(out_arg.dup());
    }
};

}  // namespace

cli::options::options() noexcept {
    auto env_level = modsel::getenv("MODSEL_LOG_LEVEL");
    if (env_level) {
        log_level = magic_enum::enum_cast<log::level>(*env_level).value_or(log_level);
    }
}

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}
