#include "./argument.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

using namespace debate;

using strv = std::string_view;

std::optional<strv> argument::match_long(strv given) const noexcept {
    for (auto& cand : long_spellings) {
        if (given == cand || (given.starts_with(cand) && given[cand.size()] == '=')) {
            return cand;
        }
    }
    return std::nullopt;
}

std::optional<strv> argument::match_short(strv given) const noexcept {
    for (auto& cand : short_spellings) {
        if (given.starts_with(cand)) {
            return cand;
        }
    }
    return std::nullopt;
}

std::string argument::preferred_spelling() const noexcept {
    if (!long_spellings.empty()) {
        return "--" + long_spellings.front();
    } else if (!short_spellings.empty()) {
        return "-" + short_spellings.front();
    }
    return valname;
}

std::string argument::syntax_string() const noexcept {
    auto spelling = preferred_spelling();
    if (is_positional()) {
        auto s = can_repeat ? fmt::format("{} [...]", valname) : valname;
        return required ? s : fmt::format("[{}]", s);
    }
    std::string s = spelling;
    if (nargs != 0) {
        s += (spelling.starts_with("--") ? "=" : " ");
        s += valname.empty() ? "<value>" : valname;
    }
    return required ? s : fmt::format("[{}]", s);
}

std::string argument::help_string() const noexcept {
    std::string ret;
    auto        valstr = valname.empty() ? std::string("<value>") : valname;
    for (auto& l : long_spellings) {
        ret += fmt::format(fmt::emphasis::bold, "--{}", l);
        if (nargs != 0) {
            ret += fmt::format(fmt::emphasis::italic, "={}", valstr);
        }
        ret += '\n';
    }
    for (auto& s : short_spellings) {
        ret += fmt::format(fmt::emphasis::bold, "-{}", s);
        if (nargs != 0) {
            ret += fmt::format(fmt::emphasis::italic, " {}", valstr);
        }
        ret += '\n';
    }
    if (is_positional()) {
        ret += fmt::format(fmt::emphasis::bold, "{}\n", valname);
    }
    ret += "  ";
    for (auto c : help) {
        ret += c;
        if (c == '\n') {
            ret += "  ";
        }
    }
    ret += '\n';
    return ret;
}
