#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <modsel/error/on_error.hpp>

#include <neo/assert.hpp>

using namespace modsel;

namespace modsel::cli {

namespace cmd {
using command = int(const options&);

command resolve;
command parse;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return modsel::handle_cli_errors([&] {
        MODSEL_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::resolve:
            return cmd::resolve(opts);
        case subcommand::parse:
            return cmd::parse(opts);
        case subcommand::_none_:;
        }
        neo::unreachable();
    });
}

}  // namespace modsel::cli
