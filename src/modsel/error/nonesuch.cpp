#include "./nonesuch.hpp"

#include <modsel/util/log.hpp>

#include <fmt/color.h>

#include <iomanip>

using namespace modsel;

void e_nonesuch::log_error(std::string_view fmt) const noexcept {
    modsel_log(error, fmt, given);
    if (nearest) {
        modsel_log(error,
                   "  (Did you mean '{}'?)",
                   fmt::format(fmt::emphasis::bold | fg(fmt::terminal_color::bright_yellow),
                               "{}",
                               *nearest));
    }
}

void e_nonesuch::ostream_into(std::ostream& out) const noexcept {
    out << "modsel::e_nonesuch: Given " << std::quoted(given);
    if (nearest.has_value()) {
        out << " (nearest is " << std::quoted(*nearest) << ")";
    }
}
