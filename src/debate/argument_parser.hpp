#pragma once

#include "./argument.hpp"

#include <functional>
#include <initializer_list>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

class argument_parser;
struct subparser;

/**
 * @brief A set of mutually exclusive subcommands attached to a parser
 */
struct subparser_group {
    std::string valname = "<subcommand>";

    std::string description{};

    bool required = true;

    const argument_parser* _p_parent = nullptr;
    std::list<subparser>   _p_subparsers{};

    argument_parser& add_parser(subparser);
};

class argument_parser {
    friend struct subparser_group;

    std::list<argument>            _arguments;
    std::optional<subparser_group> _subparsers;
    std::string                    _name;
    std::string                    _description;
    // Set when this parser belongs to a subparser_group
    const argument_parser* _parent = nullptr;

    void _parse(const std::vector<std::string_view>& args) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    argument_parser(std::string name, std::string description)
        : _name(std::move(name))
        , _description(std::move(description)) {}

    argument& add_argument(argument arg) noexcept;

    subparser_group& add_subparsers(subparser_group grp = {}) noexcept;

    std::string usage_string(std::string_view progname) const noexcept;
    std::string help_string(std::string_view progname) const noexcept;

    /**
     * @brief Parse the given command-line arguments, not including the program name. Errors
     * are thrown as Boost.LEAF exceptions carrying e_argument_parser.
     */
    template <typename Range>
    void parse_argv(const Range& range) const {
        _parse(std::vector<std::string_view>(std::begin(range), std::end(range)));
    }

    void parse_argv(std::initializer_list<std::string_view> args) const {
        _parse(std::vector<std::string_view>(args));
    }

    auto  parent() const noexcept { return _parent; }
    auto& name() const noexcept { return _name; }
    auto& arguments() const noexcept { return _arguments; }
    auto& subparsers() const noexcept { return _subparsers; }
};

struct subparser {
    std::string name;
    std::string help;

    std::function<void()> action{};

    argument_parser _p_parser{name, help};
};

}  // namespace debate
