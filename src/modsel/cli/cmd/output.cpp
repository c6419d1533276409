#include "./output.hpp"

#include "../options.hpp"

#include <modsel/util/fs/io.hpp>
#include <modsel/util/log.hpp>

#include <nlohmann/json.hpp>

#include <iostream>

using namespace modsel;

void cli::write_command_output(const options& opts, const nlohmann::json& data) {
    auto text = data.dump(2) + "\n";
    if (opts.out_path) {
        modsel::write_file(*opts.out_path, text);
        modsel_log(info, "Output written to [{}]", opts.out_path->string());
    } else {
        std::cout << text;
    }
}
