#pragma once

#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

/**
 * @brief Thrown when '--help' or '-h' is given. The handler should print the help string of the
 * parser in e_argument_parser.
 */
struct help_request : std::exception {};

struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// The argument that was being handled
struct e_argument {
    const debate::argument& value;
};

/// The innermost parser that was active
struct e_argument_parser {
    const debate::argument_parser& value;
};

struct e_invalid_arg_value {
    std::string value;
};

/// The number of values that were given to an argument
struct e_wrong_val_num {
    int value;
};

/// The argument as the user spelled it
struct e_arg_spelling {
    std::string value;
};

}  // namespace debate
