#include "./registry.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/result.hpp>
#include <modsel/util/string.hpp>

#include <boost/leaf/on_error.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <type_traits>

using namespace modsel;

namespace {

auto forbidden(std::string_view unit_name, override_kind kind) {
    return new_error(
        errc::forbidden_override,
        e_human_message{neo::ufmt("Declaring {} in a non-root unit is forbidden, but unit \"{}\" "
                                  "declares them.",
                                  kind_name(kind),
                                  unit_name)},
        e_remediation{"Move the override into the root unit, or evaluate the unit in isolation"});
}

}  // namespace

template <typename T>
const T* override_registry::_find(const std::vector<T>& vec, std::string_view path) noexcept {
    auto it = std::ranges::find(vec, path, &T::path);
    return it == vec.end() ? nullptr : &*it;
}

const archive_override* override_registry::find_archive(std::string_view path) const noexcept {
    return _find(_archives, path);
}

const build_override* override_registry::find_build(std::string_view path) const noexcept {
    return _find(_builds, path);
}

const patch_override* override_registry::find_patch(std::string_view path) const noexcept {
    return _find(_patches, path);
}

bool override_registry::_contains(override_kind kind, std::string_view path) const noexcept {
    switch (kind) {
    case override_kind::archive:
        return find_archive(path) != nullptr;
    case override_kind::build:
        return find_build(path) != nullptr;
    case override_kind::patch:
        return find_patch(path) != nullptr;
    }
    neo::unreachable();
}

bool override_registry::targets(std::string_view path) const noexcept {
    return _contains(override_kind::archive, path) || _contains(override_kind::build, path)
        || _contains(override_kind::patch, path);
}

result<void> override_registry::add_from_unit(std::string_view                    unit_name,
                                              bool                                privileged,
                                              const std::vector<module_override>& overrides) {
    if (!privileged && !overrides.empty()) {
        return forbidden(unit_name, kind_of(overrides.front()));
    }

    for (auto& ovr : overrides) {
        auto&      path = path_of(ovr);
        const auto kind = kind_of(ovr);
        MODSEL_E_SCOPE(e_module_path{path});

        if (_contains(kind, path)) {
            return new_error(errc::duplicate_override,
                             e_human_message{
                                 neo::ufmt("Multiple overrides defined for Go module path \"{}\" "
                                           "in module \"{}\".",
                                           path,
                                           unit_name)});
        }

        // Archive overrides carry their own patches, so they cannot be combined with a patch
        // override for the same path
        auto other = kind == override_kind::archive ? override_kind::patch
            : kind == override_kind::patch          ? override_kind::archive
                                                    : kind;
        if (other != kind && _contains(other, path)) {
            return new_error(errc::conflicting_override,
                             e_human_message{
                                 neo::ufmt("Go module path \"{}\" in module \"{}\" is the target "
                                           "of both {} and {}.",
                                           path,
                                           unit_name,
                                           kind_name(other),
                                           kind_name(kind))},
                             e_remediation{"Move the patches into the archive override"});
        }

        if (auto build = std::get_if<build_override>(&ovr)) {
            for (auto& dir : build->directives) {
                BOOST_LEAF_CHECK(check_directive(dir));
            }
        }

        std::visit(
            [&](auto& o) {
                using T = std::decay_t<decltype(o)>;
                if constexpr (std::is_same_v<T, archive_override>) {
                    _archives.push_back(o);
                } else if constexpr (std::is_same_v<T, build_override>) {
                    _builds.push_back(o);
                } else {
                    _patches.push_back(o);
                }
            },
            ovr);
    }
    return {};
}

std::vector<diagnostic>
override_registry::unmatched(const std::function<bool(std::string_view)>& is_resolved) const {
    std::vector<diagnostic> ret;
    auto check = [&](override_kind kind, const auto& vec) {
        std::vector<std::string> missing;
        for (auto& o : vec) {
            if (!is_resolved(o.path)) {
                missing.push_back(o.path);
            }
        }
        if (missing.empty()) {
            return;
        }
        ret.push_back(diagnostic{
            .code        = errc::dangling_override,
            .message     = neo::ufmt("Some {} did not target a Go module with a matching path: {}",
                                 kind_name(kind),
                                 joinstr(", ", missing)),
            .remediation = "Remove the overrides, or require the modules that they name",
            .module_path = missing.front(),
        });
    };
    check(override_kind::archive, _archives);
    check(override_kind::build, _builds);
    check(override_kind::patch, _patches);
    return ret;
}
