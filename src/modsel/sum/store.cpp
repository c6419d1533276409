#include "./store.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/result.hpp>
#include <modsel/manifest/error.hpp>
#include <modsel/manifest/tokenize.hpp>
#include <modsel/util/string.hpp>
#include <modsel/version/version.hpp>

#include <neo/ufmt.hpp>

using namespace modsel;

result<std::vector<sum_entry>> modsel::parse_sum_file(std::string_view             content,
                                                      const std::filesystem::path& file) {
    MODSEL_E_SCOPE(e_parse_file{file});
    std::vector<sum_entry> ret;
    auto                   normalized = normalize_whitespace(content);

    int line_no = 0;
    for (auto line : split_lines(normalized)) {
        ++line_no;
        line = trim_view(line);
        if (line.empty()) {
            continue;
        }
        std::vector<std::string> fields;
        for (auto& part : split(line, " ")) {
            if (!part.empty()) {
                fields.push_back(std::move(part));
            }
        }
        if (fields.size() != 3) {
            return new_error(errc::sum_parse,
                             e_parse_line{line_no},
                             e_human_message{neo::ufmt("expected 'path version hash', but the line "
                                                       "has {} fields",
                                                       fields.size())});
        }
        if (fields[1].ends_with("/go.mod")) {
            continue;
        }
        ret.push_back(sum_entry{
            .path    = std::move(fields[0]),
            .version = canonicalize_raw_version(fields[1]),
            .hash    = std::move(fields[2]),
            .line    = line_no,
        });
    }
    return ret;
}

std::optional<diagnostic>
sum_store::insert(std::string_view path, std::string_view version, std::string_view hash) {
    auto key      = key_type(path, version);
    auto [it, ok] = _sums.try_emplace(key, hash);
    if (ok || it->second == hash) {
        return std::nullopt;
    }
    return diagnostic{
        .code        = errc::checksum_mismatch,
        .message     = neo::ufmt("Multiple mismatching sums for {}@{} found. {} vs {}",
                             path,
                             version,
                             hash,
                             it->second),
        .remediation = "Regenerate the affected checksum files with 'go mod tidy'",
        .module_path = std::string(path),
    };
}

std::vector<diagnostic> sum_store::insert_all(const std::vector<sum_entry>& entries) {
    std::vector<diagnostic> ret;
    for (auto& ent : entries) {
        if (auto mismatch = insert(ent.path, ent.version, ent.hash)) {
            ret.push_back(std::move(*mismatch));
        }
    }
    return ret;
}

const std::string* sum_store::lookup(std::string_view path, std::string_view version) const {
    auto it = _sums.find(key_type(path, version));
    if (it == _sums.end()) {
        return nullptr;
    }
    return &it->second;
}
