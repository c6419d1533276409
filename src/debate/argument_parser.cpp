#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <set>

using namespace debate;

using strv = std::string_view;

namespace {

struct parse_run {
    const std::vector<strv>& args;
    const argument_parser*   bottom;

    std::size_t               pos              = 0;
    int                       positional_index = 0;
    bool                      options_ended    = false;
    std::set<const argument*> seen{};

    bool at_end() const noexcept { return pos == args.size(); }
    strv current() const noexcept { return args[pos]; }

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{*bottom}; });
        while (!at_end()) {
            auto given = current();
            ++pos;
            if (!options_ended && given == "--") {
                options_ended = true;
            } else if (!options_ended && given.size() > 2 && given.starts_with("--")) {
                parse_long(given);
            } else if (!options_ended && given.size() > 1 && given[0] == '-') {
                parse_short(given);
            } else if (!parse_positional(given) && !parse_subcommand(given)) {
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                           e_arg_spelling{std::string(given)});
            }
        }
        finalize();
    }

    void see(const argument& arg) {
        if (!seen.insert(&arg).second && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Argument given more than once"));
        }
    }

    /// Find an option in the active parser or one of its parents
    template <typename Match>
    std::pair<const argument*, strv> find_option(Match&& match) const {
        for (auto p = bottom; p; p = p->parent()) {
            for (auto& arg : p->arguments()) {
                if (auto m = match(arg)) {
                    return {&arg, *m};
                }
            }
        }
        return {nullptr, {}};
    }

    strv take_value(const argument& arg) {
        if (at_end()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value"),
                                       e_argument{arg},
                                       e_wrong_val_num{0});
        }
        return args[pos++];
    }

    void parse_long(strv given) {
        auto tail = given.substr(2);
        if (tail == "help") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        auto [arg, matched] = find_option([&](auto& a) { return a.match_long(tail); });
        if (!arg) {
            BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                       e_arg_spelling{std::string(given)});
        }
        auto spelling = fmt::format("--{}", matched);
        auto _ = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});
        see(*arg);
        tail.remove_prefix(matched.size());
        if (arg->nargs == 0) {
            if (!tail.empty()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Argument does not expect a value"),
                                           e_wrong_val_num{1});
            }
            arg->action("", spelling);
        } else if (!tail.empty()) {
            // '--name=value'
            arg->action(tail.substr(1), spelling);
        } else {
            arg->action(take_value(*arg), spelling);
        }
    }

    void parse_short(strv given) {
        auto tail = given.substr(1);
        if (tail == "h") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        auto [arg, matched] = find_option([&](auto& a) { return a.match_short(tail); });
        if (!arg) {
            BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                       e_arg_spelling{std::string(given)});
        }
        auto spelling = fmt::format("-{}", matched);
        auto _ = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});
        see(*arg);
        tail.remove_prefix(matched.size());
        if (arg->nargs == 0) {
            if (!tail.empty()) {
                // Grouped switches are not supported
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                           e_arg_spelling{std::string(given)});
            }
            arg->action("", spelling);
        } else if (!tail.empty()) {
            // '-Xvalue'
            arg->action(tail, spelling);
        } else {
            arg->action(take_value(*arg), spelling);
        }
    }

    bool parse_positional(strv given) {
        int idx = 0;
        for (auto& arg : bottom->arguments()) {
            if (!arg.is_positional()) {
                continue;
            }
            if (idx++ != positional_index) {
                continue;
            }
            auto _ = boost::leaf::on_error(e_argument{arg},
                                           e_arg_spelling{arg.preferred_spelling()});
            see(arg);
            arg.action(given, arg.preferred_spelling());
            if (!arg.can_repeat) {
                ++positional_index;
            }
            return true;
        }
        return false;
    }

    bool parse_subcommand(strv given) {
        if (!bottom->subparsers()) {
            return false;
        }
        for (auto& cand : bottom->subparsers()->_p_subparsers) {
            if (cand.name != given) {
                continue;
            }
            if (cand.action) {
                cand.action();
            }
            bottom           = &cand._p_parser;
            positional_index = 0;
            return true;
        }
        return false;
    }

    void finalize() {
        for (auto p = bottom; p; p = p->parent()) {
            for (auto& arg : p->arguments()) {
                if (arg.required && !seen.contains(&arg)) {
                    BOOST_LEAF_THROW_EXCEPTION(missing_required("Required argument is missing"),
                                               e_argument{arg});
                }
            }
        }
        if (bottom->subparsers() && bottom->subparsers()->required) {
            BOOST_LEAF_THROW_EXCEPTION(missing_required("Expected a subcommand"));
        }
    }
};

}  // namespace

void argument_parser::_parse(const std::vector<strv>& args) const {
    parse_run{args, this}.run();
}

argument& argument_parser::add_argument(argument arg) noexcept {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

subparser_group& argument_parser::add_subparsers(subparser_group grp) noexcept {
    _subparsers.emplace(std::move(grp));
    _subparsers->_p_parent = this;
    return *_subparsers;
}

argument_parser& subparser_group::add_parser(subparser sub) {
    _p_subparsers.push_back(std::move(sub));
    auto& p   = _p_subparsers.back()._p_parser;
    p._parent = _p_parent;
    return p;
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    std::string command = std::string(progname);
    std::string chain;
    for (auto p = this; p; p = p->parent()) {
        if (!p->_name.empty()) {
            chain = " " + p->_name + chain;
        }
    }
    auto ret    = fmt::format("Usage: {}{}", command, chain);
    auto indent = std::min<std::size_t>(ret.size() + 1, 20);
    auto col    = ret.size();
    auto append = [&](const std::string& part) {
        if (col + part.size() + 1 > 79 && col > indent) {
            ret += "\n" + std::string(indent, ' ');
            col = indent;
        } else {
            ret += ' ';
            ++col;
        }
        ret += part;
        col += part.size();
    };
    for (auto& arg : _arguments) {
        append(arg.syntax_string());
    }
    if (_subparsers) {
        std::string names;
        for (auto& sub : _subparsers->_p_subparsers) {
            names += names.empty() ? sub.name : "," + sub.name;
        }
        append("{" + names + "}");
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    auto ret = usage_string(progname) + "\n\n";
    if (!_description.empty()) {
        ret += _description + "\n\n";
    }
    auto section = [&](std::string_view title, bool want_required) {
        bool any = false;
        for (auto& arg : _arguments) {
            if (arg.required != want_required) {
                continue;
            }
            if (!any) {
                ret += fmt::format("{}:\n\n", title);
                any = true;
            }
            ret += arg.help_string() + "\n";
        }
    };
    section("required arguments", true);
    section("optional arguments", false);
    if (_subparsers) {
        ret += "Subcommands:\n\n";
        if (!_subparsers->description.empty()) {
            ret += fmt::format("  {}\n\n", _subparsers->description);
        }
        for (auto& sub : _subparsers->_p_subparsers) {
            ret += fmt::format(fmt::emphasis::bold, "{}", sub.name);
            ret += fmt::format("\n  {}\n\n", sub.help);
        }
    }
    return ret;
}
