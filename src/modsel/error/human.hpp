#pragma once

#include <string>

namespace modsel {

/**
 * @brief A human-readable message describing the error
 */
struct e_human_message {
    std::string value;
};

/**
 * @brief A suggestion of what the user may do to correct the problem
 */
struct e_remediation {
    std::string value;
};

}  // namespace modsel
