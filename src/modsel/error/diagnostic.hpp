#pragma once

#include "./errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace modsel {

/**
 * @brief A single reportable finding from an evaluation.
 *
 * Fatal diagnostics are collected and reported together when the evaluation finishes. Non-fatal
 * ones are printed as they are found and returned alongside the resolution.
 */
struct diagnostic {
    modsel::errc code = errc::none;
    // The complete human-readable message
    std::string message;
    // A suggestion of how to fix the problem. May be empty.
    std::string remediation{};
    // The module path that the diagnostic concerns, if any
    std::optional<std::string> module_path{};

    error_class klass() const noexcept { return class_of(code); }
};

/**
 * @brief The module path that an error concerns
 */
struct e_module_path {
    std::string value;
};

/**
 * @brief Error object carrying every fatal diagnostic collected before the evaluation failed
 */
struct e_diagnostics {
    std::vector<diagnostic> value;
};

}  // namespace modsel
