#pragma once

#include <functional>

namespace modsel {

/**
 * @brief Invoke the given function, and report any error that escapes it.
 *
 * @return The value returned by `fn`, or the exit code for the error that was reported
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace modsel
