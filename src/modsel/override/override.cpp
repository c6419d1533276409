#include "./override.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/result.hpp>

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <cctype>

using namespace modsel;

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

}  // namespace

std::string_view modsel::to_string(build_file_generation g) noexcept {
    switch (g) {
    case build_file_generation::automatic:
        return "auto";
    case build_file_generation::on:
        return "on";
    case build_file_generation::off:
        return "off";
    }
    neo::unreachable();
}

std::optional<build_file_generation> modsel::parse_build_file_generation(std::string_view s) noexcept {
    if (s == "auto") {
        return build_file_generation::automatic;
    } else if (s == "on") {
        return build_file_generation::on;
    } else if (s == "off") {
        return build_file_generation::off;
    }
    return std::nullopt;
}

override_kind modsel::kind_of(const module_override& ovr) noexcept {
    return std::visit(overloaded{
                          [](const archive_override&) { return override_kind::archive; },
                          [](const build_override&) { return override_kind::build; },
                          [](const patch_override&) { return override_kind::patch; },
                      },
                      ovr);
}

std::string_view modsel::kind_name(override_kind k) noexcept {
    switch (k) {
    case override_kind::archive:
        return "archive_overrides";
    case override_kind::build:
        return "gazelle_overrides";
    case override_kind::patch:
        return "module_overrides";
    }
    neo::unreachable();
}

const std::string& modsel::path_of(const module_override& ovr) noexcept {
    return std::visit([](auto& o) -> const std::string& { return o.path; }, ovr);
}

result<void> modsel::check_directive(std::string_view directive) {
    constexpr std::string_view prefix = "gazelle:";
    if (directive.starts_with(prefix)) {
        auto rest = directive.substr(prefix.size());
        if (!rest.empty() && !std::isspace(static_cast<unsigned char>(rest[0]))
            && rest.find(' ') != rest.npos) {
            return {};
        }
    }
    return new_error(errc::invalid_directive,
                     e_human_message{
                         neo::ufmt("Invalid Gazelle directive: \"{}\". Gazelle directives must be "
                                   "of the form \"gazelle:key value\".",
                                   directive)});
}

std::optional<std::string> modsel::directive_value(const std::vector<std::string>& directives,
                                                   std::string_view                key) {
    std::optional<std::string> ret;
    auto                       prefix = neo::ufmt("gazelle:{} ", key);
    for (auto& dir : directives) {
        if (dir.starts_with(prefix)) {
            ret = dir.substr(prefix.size());
        }
    }
    return ret;
}

std::vector<std::string> modsel::patch_args_for(int patch_strip) {
    return {neo::ufmt("-p{}", patch_strip)};
}
