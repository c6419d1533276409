#include "./lang_version.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>

#include <neo/ufmt.hpp>

#include <charconv>

using namespace modsel;

result<lang_version> lang_version::parse(std::string_view str) {
    lang_version ret;
    auto         bad = [&] {
        return new_error(errc::manifest_parse,
                         e_human_message{neo::ufmt("invalid language version '{}'", str)});
    };
    const auto end = str.data() + str.size();
    auto       res = std::from_chars(str.data(), end, ret.major);
    if (res.ec != std::errc{} || res.ptr == end || *res.ptr != '.') {
        return bad();
    }
    res = std::from_chars(res.ptr + 1, end, ret.minor);
    if (res.ec != std::errc{}) {
        return bad();
    }
    // Anything following the minor version (".3", "rc1") is ignored
    return ret;
}

std::string lang_version::to_string() const noexcept {
    return std::to_string(major) + "." + std::to_string(minor);
}
