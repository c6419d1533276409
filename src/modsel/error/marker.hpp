#pragma once

#include <string_view>

namespace modsel {

/**
 * @brief Write a stable identifier of the error being reported to the file named by the
 * MODSEL_WRITE_ERROR_MARKER environment variable, if it is set.
 */
void write_error_marker(std::string_view) noexcept;

}  // namespace modsel
