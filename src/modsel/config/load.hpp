#pragma once

#include <modsel/resolve/unit.hpp>

#include <json5/data.hpp>

#include <filesystem>

namespace modsel {

/**
 * @brief Load an evaluation from the YAML file at the given path.
 *
 * Relative file references within the units are resolved against the directory that contains
 * the file.
 *
 * @throws on I/O errors, malformed YAML, and invalid configuration data. Configuration errors
 * carry e_invalid_config_data or e_bad_config_key.
 */
evaluation load_evaluation(const std::filesystem::path& yaml_path);

/**
 * @brief Build an evaluation from already-parsed data. Relative paths are resolved against
 * `base_dir`.
 */
evaluation evaluation_from_data(const json5::data& data, const std::filesystem::path& base_dir);

}  // namespace modsel
