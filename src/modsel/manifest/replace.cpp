#include "./replace.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>
#include <modsel/version/version.hpp>

#include <neo/ufmt.hpp>

using namespace modsel;

result<replace_entry> replace_entry::from_tokens(const std::vector<std::string>& tokens) {
    const auto n = tokens.size();
    if (n == 4 && tokens[1] == "=>") {
        return replace_entry{
            .from_path  = tokens[0],
            .to_path    = tokens[2],
            .to_version = canonicalize_raw_version(tokens[3]),
        };
    } else if (n == 5 && tokens[2] == "=>") {
        return replace_entry{
            .from_path    = tokens[0],
            .from_version = canonicalize_raw_version(tokens[1]),
            .to_path      = tokens[3],
            .to_version   = canonicalize_raw_version(tokens[4]),
        };
    } else if (n == 3 && tokens[1] == "=>") {
        return replace_entry{
            .from_path = tokens[0],
            .to_path   = tokens[0],
            .local_dir = tokens[2],
        };
    } else if (n == 4 && tokens[2] == "=>") {
        return replace_entry{
            .from_path    = tokens[0],
            .from_version = canonicalize_raw_version(tokens[1]),
            .to_path      = tokens[0],
            .local_dir    = tokens[3],
        };
    }
    if (n == 0) {
        return new_error(errc::manifest_parse,
                         e_human_message{"expected another token after 'replace'"});
    }
    return new_error(errc::manifest_parse,
                     e_human_message{neo::ufmt("invalid 'replace' directive for '{}': expected "
                                               "'path [version] => path [version]'",
                                               tokens[0])});
}

void replace_map::assign(replace_entry entry) {
    auto key = entry.from_path;
    _entries.insert_or_assign(std::move(key), std::move(entry));
}

void replace_map::assign_all(const replace_map& other) {
    for (auto& [_, entry] : other) {
        assign(entry);
    }
}

const replace_entry* replace_map::find(std::string_view from_path) const noexcept {
    auto it = _entries.find(from_path);
    if (it == _entries.end()) {
        return nullptr;
    }
    return &it->second;
}
