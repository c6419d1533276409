#pragma once

#include <optional>
#include <string>

namespace modsel {

std::optional<std::string> getenv(const std::string& env) noexcept;

}  // namespace modsel
