#include "./version.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>

#include <charconv>
#include <tuple>

using namespace modsel;

namespace {

/**
 * Parse the '-prerelease' and '+build' tail that is shared by the strict and relaxed forms.
 */
void parse_tail(module_version& ret, std::string_view full, std::string_view remaining) {
    auto off_of = [&](std::string_view part) { return part.data() - full.data(); };
    if (!remaining.empty() && remaining[0] == '-') {
        auto plus_pos       = remaining.find('+');
        auto prerelease_str = remaining.substr(1, plus_pos == remaining.npos ? remaining.npos
                                                                             : plus_pos - 1);
        if (prerelease_str.empty()) {
            throw invalid_version(std::string(full), off_of(remaining) + 1);
        }
        ret.prerelease = ident::parse_dotted_seq(prerelease_str);
        for (auto& id : ret.prerelease) {
            if (id.kind() == ident_kind::digits) {
                throw invalid_version(std::string(full), off_of(remaining) + 1);
            }
        }
        remaining = remaining.substr(prerelease_str.size() + 1);
    }

    if (!remaining.empty() && remaining[0] == '+') {
        auto bmeta_str     = remaining.substr(1);
        ret.build_metadata = ident::parse_dotted_seq(bmeta_str);
        remaining          = remaining.substr(bmeta_str.size() + 1);
    }

    if (!remaining.empty()) {
        throw invalid_version(std::string(full), off_of(remaining));
    }
}

module_version parse_strict(std::string_view str) {
    module_version ret;
    const auto     str_begin = str.data();
    const auto     str_end   = str_begin + str.size();
    auto           ptr       = str_begin;
    auto           bad_here  = [&] { return invalid_version(std::string(str), ptr - str_begin); };

    int* const parts[] = {&ret.major, &ret.minor, &ret.patch};
    for (auto i = 0; i < 3; ++i) {
        auto fc_res = std::from_chars(ptr, str_end, *parts[i]);
        if (fc_res.ec != std::errc{} || *parts[i] < 0) {
            throw bad_here();
        }
        ptr = fc_res.ptr;
        if (i != 2) {
            if (ptr == str_end || *ptr != '.') {
                throw bad_here();
            }
            ++ptr;
        }
    }

    parse_tail(ret, str, std::string_view(ptr, str_end - ptr));
    return ret;
}

module_version parse_relaxed_impl(std::string_view str) {
    module_version ret;
    auto           tail_pos = str.find_first_of("-+");
    auto           release  = str.substr(0, tail_pos);
    if (release.empty()) {
        throw invalid_version(std::string(str), 0);
    }

    int* const parts[]   = {&ret.major, &ret.minor, &ret.patch};
    int        n_numeric = 0;
    auto       segs      = ident::parse_dotted_seq(release);
    for (auto& seg : segs) {
        if (ret.extra_release.empty() && n_numeric < 3 && seg.kind() == ident_kind::numeric) {
            auto& s      = seg.string();
            auto  fc_res = std::from_chars(s.data(), s.data() + s.size(), *parts[n_numeric]);
            if (fc_res.ec != std::errc{}) {
                throw invalid_version(std::string(str), 0);
            }
            ++n_numeric;
        } else {
            ret.extra_release.push_back(seg);
        }
    }
    if (n_numeric == 0) {
        // At least the major version must be present
        throw invalid_version(std::string(str), 0);
    }

    parse_tail(ret,
               str,
               tail_pos == str.npos ? std::string_view() : str.substr(tail_pos));
    return ret;
}

template <typename Fn>
result<module_version> parse_as_result(std::string_view s, Fn&& fn) {
    try {
        return fn(s);
    } catch (const invalid_version& e) {
        return new_error(e_invalid_version_string{std::string(s)},
                         e_human_message{e.what()},
                         errc::invalid_version);
    } catch (const invalid_ident& e) {
        return new_error(e_invalid_version_string{std::string(s)},
                         e_human_message{e.what()},
                         errc::invalid_version);
    }
}

}  // namespace

module_version module_version::parse(std::string_view s) { return parse_strict(s); }

module_version module_version::parse_relaxed(std::string_view s) { return parse_relaxed_impl(s); }

module_version module_version::highest() noexcept {
    return module_version{.major = 999999, .minor = 999999, .patch = 999999};
}

std::string module_version::to_string() const noexcept {
    auto ret = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!extra_release.empty()) {
        ret += "." + join_idents(extra_release);
    }
    if (!prerelease.empty()) {
        ret += "-" + join_idents(prerelease);
    }
    if (!build_metadata.empty()) {
        ret += "+" + join_idents(build_metadata);
    }
    return ret;
}

order modsel::compare(const module_version& lhs, const module_version& rhs) noexcept {
    auto lhs_tup = std::tie(lhs.major, lhs.minor, lhs.patch);
    auto rhs_tup = std::tie(rhs.major, rhs.minor, rhs.patch);
    if (lhs_tup < rhs_tup) {
        return order::less;
    } else if (lhs_tup > rhs_tup) {
        return order::greater;
    }
    auto extra_ord = compare(lhs.extra_release, rhs.extra_release);
    if (extra_ord != order::equivalent) {
        return extra_ord;
    }
    if (!lhs.is_prerelease() && rhs.is_prerelease()) {
        // No prerelease is greater than any prerelease
        return order::greater;
    } else if (lhs.is_prerelease() && !rhs.is_prerelease()) {
        return order::less;
    }
    return compare(lhs.prerelease, rhs.prerelease);
}

std::string modsel::canonicalize_raw_version(std::string_view raw) {
    if (raw.starts_with('v')) {
        raw.remove_prefix(1);
    }
    return std::string(raw);
}

result<module_version> modsel::parse_version(std::string_view canonical) {
    return parse_as_result(canonical, parse_strict);
}

result<module_version> modsel::parse_relaxed_version(std::string_view canonical) {
    return parse_as_result(canonical, parse_relaxed_impl);
}
