#include "./io.hpp"

#include <modsel/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <fstream>
#include <sstream>

using namespace modsel;

using path_ref = const std::filesystem::path&;

std::fstream modsel::open_file(path_ref fpath, std::ios::openmode mode) {
    MODSEL_E_SCOPE(e_open_file_path{fpath});
    errno = 0;
    std::fstream ret{fpath, mode};
    auto         e = errno;
    if (!ret) {
        auto ec = std::error_code{e, std::system_category()};
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to open file [{}]",
                                                               fpath.string())),
                                   boost::leaf::e_errno{e},
                                   ec);
    }
    return ret;
}

void modsel::write_file(path_ref dest, std::string_view content) {
    MODSEL_E_SCOPE(e_write_file_path{dest});
    auto ofile = open_file(dest, std::ios::binary | std::ios::out);
    errno      = 0;
    ofile.write(content.data(), content.size());
    auto e = errno;
    if (!ofile) {
        auto ec = std::error_code(e, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to write to file [{}]",
                                                               dest.string())),
                                   boost::leaf::e_errno{e},
                                   ec);
    }
}

std::string modsel::read_file(path_ref path) {
    MODSEL_E_SCOPE(e_read_file_path{path});
    auto               infile = open_file(path, std::ios::binary | std::ios::in);
    std::ostringstream out;
    out << infile.rdbuf();
    return std::move(out).str();
}

std::optional<std::string> modsel::read_file_if_exists(path_ref path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    return read_file(path);
}
