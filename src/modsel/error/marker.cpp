#include "./marker.hpp"

#include <modsel/util/env.hpp>
#include <modsel/util/fs/io.hpp>
#include <modsel/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>

void modsel::write_error_marker(std::string_view error) noexcept {
    modsel_log(trace, "[error marker {}]", error);
    auto efile_path = modsel::getenv("MODSEL_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    modsel_log(trace, "[error marker written to [{}]]", *efile_path);
    boost::leaf::try_catch([&] { modsel::write_file(*efile_path, error); },
                           [&](const std::system_error& exc) {
                               modsel_log(warn,
                                          "Failed to write error marker to [{}]: {}",
                                          *efile_path,
                                          exc.code().message());
                           });
}
