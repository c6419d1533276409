#pragma once

#include "./override.hpp"

#include <modsel/error/diagnostic.hpp>
#include <modsel/error/result_fwd.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

/**
 * @brief Collects the overrides declared by the units of an evaluation, one map per kind.
 *
 * Declaration order is preserved within each kind.
 */
class override_registry {
    std::vector<archive_override> _archives;
    std::vector<build_override>   _builds;
    std::vector<patch_override>   _patches;

    template <typename T>
    static const T* _find(const std::vector<T>& vec, std::string_view path) noexcept;

    bool _contains(override_kind, std::string_view path) const noexcept;

public:
    /**
     * @brief Register the overrides declared by a single unit.
     *
     * @param unit_name The name of the declaring unit, used in diagnostics
     * @param privileged Whether the unit may declare overrides at all. Only the root unit is
     * privileged, unless the evaluation is isolated to a single unit.
     *
     * Fails immediately with forbidden_override, duplicate_override, conflicting_override, or
     * invalid_directive.
     */
    result<void> add_from_unit(std::string_view                    unit_name,
                               bool                                privileged,
                               const std::vector<module_override>& overrides);

    const archive_override* find_archive(std::string_view path) const noexcept;
    const build_override*   find_build(std::string_view path) const noexcept;
    const patch_override*   find_patch(std::string_view path) const noexcept;

    /// Check whether an override of any kind names the given path
    bool targets(std::string_view path) const noexcept;

    /**
     * @brief Find the overrides that do not target any resolved module.
     *
     * @return One dangling_override diagnostic per kind that has unmatched paths, each naming
     * every unmatched path of that kind.
     */
    std::vector<diagnostic>
    unmatched(const std::function<bool(std::string_view)>& is_resolved) const;

    auto& archives() const noexcept { return _archives; }
    auto& builds() const noexcept { return _builds; }
    auto& patches() const noexcept { return _patches; }
};

}  // namespace modsel
