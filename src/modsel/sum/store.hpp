#pragma once

#include <modsel/error/diagnostic.hpp>
#include <modsel/error/result_fwd.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modsel {

/**
 * @brief A single line from a go.sum or go.work.sum file.
 */
struct sum_entry {
    std::string path;
    // The version with the leading 'v' removed
    std::string version;
    std::string hash;
    int         line = 0;

    friend bool operator==(const sum_entry&, const sum_entry&) = default;
};

/**
 * @brief Parse the content of a checksum file.
 *
 * Entries for a module's go.mod file ("v1.2.3/go.mod") do not name a source archive and are
 * omitted from the result. Blank lines are skipped. Any other line must have exactly three fields.
 */
result<std::vector<sum_entry>> parse_sum_file(std::string_view             content,
                                              const std::filesystem::path& file);

/**
 * @brief Accumulates module checksums from every checksum file and module declaration in an
 * evaluation.
 *
 * Each (path, version) pair may only ever be associated with one checksum.
 */
class sum_store {
    using key_type = std::pair<std::string, std::string>;
    std::map<key_type, std::string> _sums;

public:
    /**
     * @brief Record the checksum for path@version.
     *
     * If the pair is already known with an identical checksum, this is a no-op. If the pair is
     * known with a different checksum, nothing is changed and a checksum_mismatch diagnostic is
     * returned for the caller to report.
     */
    [[nodiscard]] std::optional<diagnostic>
    insert(std::string_view path, std::string_view version, std::string_view hash);

    /**
     * @brief Insert every entry from a parsed checksum file.
     *
     * @return The mismatches encountered, in file order
     */
    [[nodiscard]] std::vector<diagnostic> insert_all(const std::vector<sum_entry>& entries);

    /**
     * @brief Find the checksum for path@version, or nullptr if there is none
     */
    const std::string* lookup(std::string_view path, std::string_view version) const;

    std::size_t size() const noexcept { return _sums.size(); }
    bool        empty() const noexcept { return _sums.empty(); }
};

}  // namespace modsel
