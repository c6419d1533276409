#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace modsel {

struct e_open_file_path {
    std::filesystem::path value;
};

struct e_write_file_path {
    std::filesystem::path value;
};

struct e_read_file_path {
    std::filesystem::path value;
};

[[nodiscard]] std::fstream open_file(std::filesystem::path const& filepath, std::ios::openmode);
void                       write_file(std::filesystem::path const& path, std::string_view);
[[nodiscard]] std::string  read_file(std::filesystem::path const& path);

/**
 * @brief Read the entire file, or return nullopt if the file does not exist.
 *
 * Other I/O failures are still thrown.
 */
[[nodiscard]] std::optional<std::string> read_file_if_exists(std::filesystem::path const& path);

}  // namespace modsel
