#pragma once

#include <modsel/error/result_fwd.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

/**
 * @brief A single 'replace' directive.
 *
 * Versions are stored canonicalized (without a leading 'v'). A replacement that points at a local
 * directory has no target version; its target path is the source path itself and `local_dir` names
 * the directory.
 */
struct replace_entry {
    std::string                from_path;
    std::optional<std::string> from_version;
    std::string                to_path;
    std::optional<std::string> to_version;
    std::optional<std::string> local_dir;

    bool is_local() const noexcept { return local_dir.has_value(); }
    bool changes_path() const noexcept { return to_path != from_path; }

    /**
     * @brief Build a replace_entry from the tokens following the 'replace' keyword.
     *
     * Accepted shapes:
     *
     *      from => to version
     *      from from-version => to version
     *      from => local/dir
     *      from from-version => local/dir
     *
     * Any other shape is an error with errc::manifest_parse and an e_human_message.
     */
    [[nodiscard]] static result<replace_entry> from_tokens(const std::vector<std::string>& tokens);

    friend bool operator==(const replace_entry&, const replace_entry&) = default;
};

/**
 * @brief The replace entries of a manifest or workspace, keyed by source path.
 */
class replace_map {
    std::map<std::string, replace_entry, std::less<>> _entries;

public:
    /**
     * @brief Store the entry. An existing entry for the same source path is overwritten.
     */
    void assign(replace_entry entry);

    /**
     * @brief Assign every entry from `other`, in order.
     */
    void assign_all(const replace_map& other);

    [[nodiscard]] const replace_entry* find(std::string_view from_path) const noexcept;

    bool contains(std::string_view from_path) const noexcept { return find(from_path) != nullptr; }
    auto size() const noexcept { return _entries.size(); }
    bool empty() const noexcept { return _entries.empty(); }
    auto begin() const noexcept { return _entries.cbegin(); }
    auto end() const noexcept { return _entries.cend(); }

    friend bool operator==(const replace_map&, const replace_map&) = default;
};

}  // namespace modsel
