#include "./parse.hpp"

#include "./errors.hpp"

#include <modsel/error/on_error.hpp>
#include <modsel/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <string>

using namespace modsel;

YAML::Node modsel::parse_yaml_file(const std::filesystem::path& fpath) {
    MODSEL_E_SCOPE(e_parse_yaml_file_path{fpath});
    auto content = modsel::read_file(fpath);
    return parse_yaml_string(content);
}

YAML::Node modsel::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(exc, e_yaml_parse_error{exc.what()});
    }
}
