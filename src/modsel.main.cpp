#include <modsel/cli/dispatch_main.hpp>
#include <modsel/cli/options.hpp>
#include <modsel/util/log.hpp>

#include <debate/debate.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/color.h>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    modsel::log::init_logger();

    modsel::cli::options    opts;
    debate::argument_parser parser{
        "Select a consistent set of Go module versions from module manifests, workspaces, and "
        "explicit declarations"};
    opts.setup_parser(parser);

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request, debate::e_argument_parser p) {
            std::cout << p.value.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    arg) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            fmt::print(std::cerr,
                       "Unrecognized argument: \"{}\"\n",
                       fmt::styled(arg.value, fmt::emphasis::bold | fg(fmt::terminal_color::red)));
            return 2;
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            fmt::print(std::cerr, "Invalid value '{}' given for '{}'\n", val.value, spell.value);
            return 2;
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell,
            debate::e_argument        arg,
            debate::e_wrong_val_num   given) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            if (arg.value.nargs == 0) {
                fmt::print(std::cerr,
                           "Argument '{}' does not expect a value, but was given {}\n",
                           spell.value,
                           given.value);
            } else {
                fmt::print(std::cerr,
                           "Argument '{}' expected a value, but received none\n",
                           spell.value);
            }
            return 2;
        },
        [&](debate::missing_required, debate::e_argument_parser p, debate::e_argument arg) {
            fmt::print(std::cerr,
                       "{}\nMissing required argument '{}'\n",
                       p.value.usage_string(program_name),
                       arg.value.preferred_spelling());
            return 2;
        },
        [&](debate::invalid_repetition, debate::e_argument_parser p, debate::e_arg_spelling sp) {
            fmt::print(std::cerr,
                       "{}\nArgument '{}' cannot be provided more than once\n",
                       p.value.usage_string(program_name),
                       sp.value);
            return 2;
        },
        [&](debate::invalid_arguments const& err, debate::e_argument_parser p) {
            fmt::print(std::cerr,
                       "{}\nError: {}\n",
                       p.value.usage_string(program_name),
                       err.what());
            return 2;
        });
    if (result) {
        // Argument parsing finished the program
        return *result;
    }
    modsel::log::current_log_level = opts.log_level;
    return modsel::cli::dispatch_main(opts);
}

int main(int argc, char** argv) { return main_fn(argv[0], {argv + 1, argv + argc}); }
