#pragma once

#include <json5/data.hpp>

#include <yaml-cpp/node/node.h>

namespace modsel {

/**
 * @brief Convert a YAML node into the equivalent JSON data.
 *
 * Untagged scalars become booleans only when spelled "true" or "false", and numbers only when
 * they parse as such. Everything else is a string, so that "no" and "v1.2.0" are kept intact.
 */
json5::data yaml_as_json5_data(const YAML::Node&);

}  // namespace modsel
