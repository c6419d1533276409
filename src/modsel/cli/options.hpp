#pragma once

#include <modsel/util/log.hpp>

#include <filesystem>
#include <optional>

namespace debate {
class argument_parser;
}

namespace modsel::cli {

namespace fs = std::filesystem;

/**
 * @brief Top-level modsel subcommands
 */
enum class subcommand {
    _none_,
    resolve,
    parse,
};

/**
 * @brief The kind of file given to 'modsel parse'
 */
enum class parse_kind {
    mod,
    work,
    sum,
};

/**
 * @brief Complete aggregate of all modsel command-line options
 */
struct options {
    options() noexcept;

    // The `--log-level` argument. Defaults to $MODSEL_LOG_LEVEL, or 'info'
    log::level log_level = log::level::info;

    // The `--out` argument. Output goes to stdout if not given
    std::optional<fs::path> out_path;

    enum subcommand subcommand = cli::subcommand::_none_;

    struct {
        fs::path config_path;
    } resolve;

    struct {
        parse_kind kind = parse_kind::mod;
        fs::path   file;
    } parse;

    /**
     * @brief Attach the modsel subcommands and options to the given parser
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace modsel::cli
