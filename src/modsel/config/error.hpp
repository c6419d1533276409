#pragma once

#include <modsel/error/nonesuch.hpp>

#include <filesystem>
#include <string>

namespace modsel {

/**
 * @brief The configuration file that was being loaded
 */
struct e_config_file_path {
    std::filesystem::path value;
};

/**
 * @brief A description of invalid configuration data
 */
struct e_invalid_config_data {
    std::string value;
};

struct e_bad_config_key : e_nonesuch {
    using e_nonesuch::e_nonesuch;
};

}  // namespace modsel
