#pragma once

#include <filesystem>
#include <string>

namespace modsel {

/// The file that was being parsed when an error occurred
struct e_parse_file {
    std::filesystem::path value;
};

/// The 1-based line number at which a parse error occurred
struct e_parse_line {
    int value;
};

}  // namespace modsel
