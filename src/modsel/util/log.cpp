#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace modsel;

namespace {

spdlog::level::level_enum to_spdlog_level(log::level l) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo::unreachable();
}

}  // namespace

void log::init_logger() noexcept {
    // stdout is reserved for command output
    auto logger = spdlog::stderr_color_mt("modsel");
    logger->set_pattern("[%^%-5l%$] %v");
    // Filtering is done by current_log_level before a message reaches the logger
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(std::move(logger));
}

void log::log_print(level l, std::string_view msg) noexcept {
    spdlog::default_logger_raw()->log(to_spdlog_level(l), "{}", msg);
}
