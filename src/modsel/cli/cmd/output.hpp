#pragma once

#include <nlohmann/json_fwd.hpp>

namespace modsel::cli {

struct options;

/**
 * @brief Write a command's JSON result to stdout, or to the `--out` file if one was given
 */
void write_command_output(const options& opts, const nlohmann::json& data);

}  // namespace modsel::cli
