#pragma once

#include "./ident.hpp"
#include "./order.hpp"

#include <modsel/error/result_fwd.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace modsel {

class invalid_version : public std::runtime_error {
    std::string    _string;
    std::ptrdiff_t _offset = 0;

public:
    invalid_version(std::string string, std::ptrdiff_t n)
        : runtime_error("Invalid module version: " + string)
        , _string(string)
        , _offset(n) {}

    auto& string() const noexcept { return _string; }
    auto  offset() const noexcept { return _offset; }
};

/**
 * @brief Error object attached when a version string cannot be parsed
 */
struct e_invalid_version_string {
    std::string value;
};

struct module_version;
order compare(const module_version& lhs, const module_version& rhs) noexcept;

/**
 * @brief A comparable module version.
 *
 * Strict versions follow semantic versioning, which covers pseudo-versions such as
 * "0.0.0-20220905092116-b49f7bc46da2". Relaxed versions additionally allow fewer than three
 * release numbers and extra release identifiers (as in "1.2.3.bcr.1"). Both forms are
 * comparable with each other.
 */
struct module_version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    // Release segments after the patch number. Only relaxed versions have these.
    std::vector<ident> extra_release = {};
    std::vector<ident> prerelease     = {};
    // Build metadata does not take part in ordering
    std::vector<ident> build_metadata = {};

    static module_version parse(std::string_view s);
    static module_version parse_relaxed(std::string_view s);

    /**
     * @brief Obtain the sentinel version that is greater than every real version.
     */
    static module_version highest() noexcept;

    std::string to_string() const noexcept;
    bool        is_prerelease() const noexcept { return !prerelease.empty(); }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const module_version& lhs, const module_version& rhs) noexcept { \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(==, (o == order::equivalent));
    DEF_OP(!=, (o != order::equivalent));
    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP
};

/**
 * @brief Strip a single leading 'v' from a version as written in a manifest or checksum file.
 */
std::string canonicalize_raw_version(std::string_view raw);

/**
 * @brief Parse a canonicalized strict version. On failure the error carries an
 * e_invalid_version_string and errc::invalid_version.
 */
result<module_version> parse_version(std::string_view canonical);

/**
 * @brief Parse a canonicalized relaxed version.
 */
result<module_version> parse_relaxed_version(std::string_view canonical);

}  // namespace modsel
