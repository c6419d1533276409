#include "./output.hpp"

#include "../options.hpp"

#include <modsel/config/load.hpp>
#include <modsel/resolve/engine.hpp>
#include <modsel/resolve/file_source.hpp>
#include <modsel/resolve/table.hpp>
#include <modsel/util/log.hpp>

#include <nlohmann/json.hpp>

using namespace modsel;

namespace modsel::cli::cmd {

int resolve(const options& opts) {
    auto eval = modsel::load_evaluation(opts.resolve.config_path);

    modsel::disk_file_source files;
    auto res   = modsel::resolve(eval, files).value();
    auto table = modsel::build_table(res);
    modsel_log(info,
               "Resolved {} module(s) from {} unit(s)",
               table.repositories.size(),
               eval.units.size());
    if (!res.notices.empty()) {
        modsel_log(info, "{} notice(s) were reported during resolution", res.notices.size());
    }
    write_command_output(opts, modsel::to_json(table));
    return 0;
}

}  // namespace modsel::cli::cmd
