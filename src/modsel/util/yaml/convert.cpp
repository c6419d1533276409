#include "./convert.hpp"

#include "./errors.hpp"

#include <modsel/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/utility.hpp>
#include <yaml-cpp/yaml.h>

using namespace modsel;

namespace {

constexpr std::string_view tag_str   = "tag:yaml.org,2002:str";
constexpr std::string_view tag_bool  = "tag:yaml.org,2002:bool";
constexpr std::string_view tag_null  = "tag:yaml.org,2002:null";
constexpr std::string_view tag_int   = "tag:yaml.org,2002:int";
constexpr std::string_view tag_float = "tag:yaml.org,2002:float";

template <typename T>
T decode_as(const YAML::Node& node) {
    try {
        return node.as<T>();
    } catch (const YAML::TypedBadConversion<T>&) {
        BOOST_LEAF_THROW_EXCEPTION(e_yaml_invalid_spelling{node.Scalar()});
    }
}

/// A plain scalar with no tag. Version strings such as "1.2.3" must survive as strings.
json5::data untagged_scalar(const YAML::Node& node) {
    const auto& spell = node.Scalar();
    if (spell == neo::oper::any_of("true", "false")) {
        return spell == "true";
    }
    double num = 0;
    if (YAML::convert<double>::decode(node, num)) {
        return num;
    }
    return spell;
}

json5::data scalar_as_data(const YAML::Node& node) {
    std::string_view tag = node.Tag();
    if (tag == "?") {
        return untagged_scalar(node);
    } else if (tag == "!" || tag == tag_str) {
        return node.Scalar();
    } else if (tag == tag_bool) {
        return decode_as<bool>(node);
    } else if (tag == tag_null) {
        return json5::data::null_type{};
    } else if (tag == tag_int || tag == tag_float) {
        return decode_as<double>(node);
    }
    BOOST_LEAF_THROW_EXCEPTION(e_yaml_unknown_tag{std::string(tag)});
}

}  // namespace

json5::data modsel::yaml_as_json5_data(const YAML::Node& node) {
    MODSEL_E_SCOPE(e_yaml_tag{node.Tag()});
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return json5::data::null_type{};
    case YAML::NodeType::Sequence: {
        auto arr = json5::data::array_type{};
        for (const auto& elem : node) {
            arr.push_back(yaml_as_json5_data(elem));
        }
        return arr;
    }
    case YAML::NodeType::Map: {
        auto obj = json5::data::mapping_type{};
        for (const auto& pair : node) {
            obj.emplace(pair.first.Scalar(), yaml_as_json5_data(pair.second));
        }
        return obj;
    }
    case YAML::NodeType::Scalar:
        return scalar_as_data(node);
    }
    neo::unreachable();
}
