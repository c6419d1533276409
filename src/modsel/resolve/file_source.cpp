#include "./file_source.hpp"

#include <modsel/util/fs/io.hpp>

using namespace modsel;

std::string disk_file_source::read(const std::filesystem::path& path) const {
    return read_file(path);
}

std::optional<std::string> disk_file_source::read_if_exists(const std::filesystem::path& path) const {
    return read_file_if_exists(path);
}
