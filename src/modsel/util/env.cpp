#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> modsel::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}
