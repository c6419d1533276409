#include "./error_handler.hpp"

#include <modsel/config/error.hpp>
#include <modsel/error/diagnostic.hpp>
#include <modsel/error/errors.hpp>
#include <modsel/error/handle.hpp>
#include <modsel/error/human.hpp>
#include <modsel/error/marker.hpp>
#include <modsel/manifest/error.hpp>
#include <modsel/resolve/unit.hpp>
#include <modsel/util/fs/io.hpp>
#include <modsel/util/log.hpp>
#include <modsel/util/parse_enum.hpp>
#include <modsel/util/yaml/errors.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <fmt/color.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <system_error>

using namespace modsel;

namespace {

auto bold_red(const auto& v) {
    return fmt::styled(v, fmt::emphasis::bold | fg(fmt::terminal_color::bright_red));
}

auto bold_yellow(const auto& v) {
    return fmt::styled(v, fmt::emphasis::bold | fg(fmt::terminal_color::bright_yellow));
}

/// A stable identifier for the error code, as written to the error marker file
std::string marker_for(errc ec) {
    auto s = std::string(magic_enum::enum_name(ec));
    std::ranges::replace(s, '_', '-');
    return s;
}

void log_remediation(std::string_view remediation) {
    if (!remediation.empty()) {
        modsel_log(error, "  Remediation: {}", remediation);
    }
}

void log_refer(errc ec) {
    modsel_log(error, "Refer: {}", bold_yellow(error_reference_of(ec)));
    modsel_log(debug, "{}", explanation_of(ec));
}

void log_unit(const e_unit_name* unit) {
    if (unit) {
        modsel_log(error, "  (While processing unit \"{}\")", unit->value);
    }
}

auto handlers = std::tuple(  //
    [](e_bad_config_key badkey, e_config_file_path cfg) {
        modsel_log(error,
                   "Error loading the configuration from [{}]",
                   bold_yellow(cfg.value.string()));
        badkey.log_error("Unknown configuration key '{}'");
        write_error_marker("invalid-config-key");
        return 1;
    },
    [](e_invalid_config_data data, e_config_file_path cfg) {
        modsel_log(error,
                   "Error loading the configuration from [{}]: {}",
                   bold_yellow(cfg.value.string()),
                   bold_red(data.value));
        write_error_marker("invalid-configuration");
        return 1;
    },
    [](e_invalid_enum_str given, e_enum_options options, e_config_file_path cfg) {
        modsel_log(error,
                   "Error loading the configuration from [{}]: Invalid value '{}'",
                   bold_yellow(cfg.value.string()),
                   bold_red(given.value));
        modsel_log(error, "  (Expected one of: {})", options.value);
        write_error_marker("invalid-configuration");
        return 1;
    },
    [](e_yaml_parse_error err, e_parse_yaml_file_path fpath) {
        modsel_log(error,
                   "Invalid YAML file [{}]: {}",
                   bold_yellow(fpath.value.string()),
                   bold_red(err.value));
        write_error_marker("config-yaml-parse-error");
        return 1;
    },
    [](e_yaml_unknown_tag tag, e_parse_yaml_file_path fpath) {
        modsel_log(error,
                   "Unsupported YAML tag '{}' in [{}]",
                   bold_red(tag.value),
                   bold_yellow(fpath.value.string()));
        write_error_marker("config-yaml-parse-error");
        return 1;
    },
    [](e_yaml_invalid_spelling spell, e_yaml_tag tag, e_parse_yaml_file_path fpath) {
        modsel_log(error,
                   "Invalid YAML value '{}' for tag '{}' in [{}]",
                   bold_red(spell.value),
                   tag.value,
                   bold_yellow(fpath.value.string()));
        write_error_marker("config-yaml-parse-error");
        return 1;
    },
    [](errc ec, e_diagnostics diags, const e_unit_name* unit) {
        for (auto& diag : diags.value) {
            modsel_log(error, "[{}] {}", class_name(diag.klass()), bold_red(diag.message));
            log_remediation(diag.remediation);
        }
        log_unit(unit);
        modsel_log(error,
                   "Resolution failed with {} problem(s). No module table was produced.",
                   diags.value.size());
        log_refer(ec);
        write_error_marker(marker_for(ec));
        return 1;
    },
    [](errc                 ec,
       e_human_message      msg,
       e_parse_file         file,
       const e_parse_line*  line,
       const e_remediation* remediation,
       const e_unit_name*   unit) {
        if (line) {
            modsel_log(error,
                       "{}:{}: {}",
                       bold_yellow(file.value.string()),
                       line->value,
                       bold_red(msg.value));
        } else {
            modsel_log(error, "{}: {}", bold_yellow(file.value.string()), bold_red(msg.value));
        }
        if (remediation) {
            log_remediation(remediation->value);
        }
        log_unit(unit);
        log_refer(ec);
        write_error_marker(marker_for(ec));
        return 1;
    },
    [](errc                                        ec,
       e_human_message                             msg,
       const e_remediation*                        remediation,
       const e_unit_name*                          unit,
       boost::leaf::verbose_diagnostic_info const& diag) {
        modsel_log(error, "Error: {}", bold_red(msg.value));
        if (remediation) {
            log_remediation(remediation->value);
        }
        log_unit(unit);
        log_refer(ec);
        modsel_log(debug, "Additional diagnostic objects:\n{}", diag);
        write_error_marker(marker_for(ec));
        return 1;
    },
    [](errc ec, const e_unit_name* unit, boost::leaf::verbose_diagnostic_info const& diag) {
        modsel_log(error, "Error: {}", bold_red(default_error_string(ec)));
        log_unit(unit);
        log_refer(ec);
        modsel_log(debug, "Additional diagnostic objects:\n{}", diag);
        write_error_marker(marker_for(ec));
        return 1;
    },
    [](const std::system_error& exc, e_read_file_path fpath, const e_unit_name* unit) {
        modsel_log(error,
                   "Failed to read file [{}]: {}",
                   bold_yellow(fpath.value.string()),
                   exc.code().message());
        log_unit(unit);
        write_error_marker("file-read-failed");
        return 1;
    },
    [](const std::system_error& exc, e_write_file_path fpath) {
        modsel_log(error,
                   "Failed to write file [{}]: {}",
                   bold_yellow(fpath.value.string()),
                   exc.code().message());
        write_error_marker("file-write-failed");
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        modsel_log(critical,
                   "An unhandled std::system_error arose. {} Info: {}",
                   bold_red("THIS IS A MODSEL BUG!"),
                   diag);
        modsel_log(critical, "Exception message: {}", exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        modsel_log(critical,
                   "An unhandled error arose. {} Info: {}",
                   bold_red("THIS IS A MODSEL BUG!"),
                   diag);
        return 42;
    });

}  // namespace

int modsel::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
