#pragma once

#include <fmt/core.h>

#include <string_view>

namespace modsel::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        auto message = fmt::vformat(s, fmt::make_format_args(args...));
        log_print(l, message);
    }
}

#define modsel_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(modsel::log::level::Level) >= int(modsel::log::current_log_level)) {               \
            ::modsel::log::log(::modsel::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace modsel::log
