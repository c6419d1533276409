#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace modsel {

/**
 * @brief Provides the content of the manifest, workspace, and checksum files that an evaluation
 * reads.
 *
 * Failures to read are thrown as exceptions.
 */
class file_source {
public:
    virtual ~file_source() = default;

    virtual std::string read(const std::filesystem::path& path) const = 0;

    /// Read the file, or return nullopt if it does not exist
    virtual std::optional<std::string> read_if_exists(const std::filesystem::path& path) const = 0;
};

/**
 * @brief A file_source that reads from the local filesystem
 */
class disk_file_source : public file_source {
public:
    std::string                read(const std::filesystem::path& path) const override;
    std::optional<std::string> read_if_exists(const std::filesystem::path& path) const override;
};

}  // namespace modsel
