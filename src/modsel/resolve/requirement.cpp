#include "./requirement.hpp"

#include <modsel/error/diagnostic.hpp>
#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>
#include <modsel/manifest/error.hpp>

#include <neo/ufmt.hpp>

using namespace modsel;

std::string provenance::to_string() const noexcept {
    if (file.empty()) {
        return neo::ufmt("unit \"{}\"", unit);
    }
    return file.string();
}

result<requirement> requirement::create(std::string_view path,
                                        std::string_view version,
                                        bool             indirect,
                                        bool             dev_dependency,
                                        provenance       origin) {
    auto canonical = canonicalize_raw_version(version);
    auto parsed    = parse_version(canonical);
    if (!parsed) {
        return new_error(errc::invalid_version,
                         e_module_path{std::string(path)},
                         e_invalid_version_string{canonical},
                         e_human_message{neo::ufmt("Invalid version \"{}\" for Go module \"{}\" "
                                                   "required by {}",
                                                   version,
                                                   path,
                                                   origin.to_string())});
    }
    return requirement{
        .path           = std::string(path),
        .raw_version    = std::move(canonical),
        .version        = std::move(*parsed),
        .indirect       = indirect,
        .dev_dependency = dev_dependency,
        .origin         = std::move(origin),
    };
}
