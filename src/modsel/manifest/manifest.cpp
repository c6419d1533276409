#include "./manifest.hpp"

#include "./error.hpp"
#include "./tokenize.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/result.hpp>
#include <modsel/util/string.hpp>

#include <boost/leaf/on_error.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <array>
#include <optional>

using namespace modsel;

namespace {

constexpr std::array known_directives = {
    std::string_view("module"),
    std::string_view("go"),
    std::string_view("require"),
    std::string_view("replace"),
    std::string_view("exclude"),
    std::string_view("retract"),
    std::string_view("toolchain"),
};

auto parse_error(std::string message) {
    return new_error(errc::manifest_parse, e_human_message{std::move(message)});
}

struct manifest_parser {
    manifest                   out;
    std::optional<std::string> go_spelling;
    std::optional<std::string> current_block;
    int                        block_line = 0;

    result<void> parse_line(const tokenized_line& line, int line_no) {
        auto& tokens = line.tokens;
        if (current_block) {
            if (tokens[0] == ")") {
                if (tokens.size() > 1) {
                    return parse_error(neo::ufmt("unexpected token '{}' after ')'", tokens[1]));
                }
                current_block.reset();
                return {};
            }
            return parse_directive(*current_block, tokens, line, line_no);
        }

        auto& directive = tokens[0];
        if (std::ranges::find(known_directives, directive) == known_directives.end()) {
            return parse_error(neo::ufmt("unexpected token '{}' at start of line", directive));
        }
        if (tokens.size() == 1) {
            return parse_error(neo::ufmt("expected another token after '{}'", directive));
        }

        if (directive == "go") {
            // 'go' only has a single-line form
            if (go_spelling) {
                return parse_error("unexpected second 'go' directive");
            }
            if (tokens.size() > 2) {
                return parse_error(
                    neo::ufmt("unexpected token '{}' after '{}'", tokens[2], tokens[1]));
            }
            if (tokens[1] == "(") {
                return parse_error("unexpected token '(' after 'go'");
            }
            go_spelling = tokens[1];
            BOOST_LEAF_AUTO(lv, lang_version::parse(tokens[1]));
            out.lang_version = lv;
            return {};
        }

        if (tokens[1] == "(") {
            if (tokens.size() > 2) {
                return parse_error(neo::ufmt("unexpected token '{}' after '('", tokens[2]));
            }
            current_block = directive;
            block_line    = line_no;
            return {};
        }

        auto args = std::vector<std::string>(tokens.begin() + 1, tokens.end());
        return parse_directive(directive, args, line, line_no);
    }

    result<void> parse_directive(std::string_view                directive,
                                 const std::vector<std::string>& args,
                                 const tokenized_line&           line,
                                 int                             line_no) {
        if (directive == "module") {
            if (!out.module_path.empty()) {
                return parse_error("unexpected second 'module' directive");
            }
            if (args.size() > 1) {
                return parse_error(
                    neo::ufmt("unexpected token '{}' after '{}'", args[1], args[0]));
            }
            out.module_path = args[0];
        } else if (directive == "require") {
            if (args.size() != 2) {
                return parse_error("expected module path and version in 'require' directive");
            }
            out.requirements.push_back(requirement_line{
                .path     = args[0],
                .version  = args[1],
                .indirect = line.comment == "indirect",
                .line     = line_no,
            });
        } else if (directive == "replace") {
            BOOST_LEAF_AUTO(entry, replace_entry::from_tokens(args));
            out.replaces.assign(std::move(entry));
        }
        // 'exclude', 'retract', and 'toolchain' have no effect on resolution
        return {};
    }
};

}  // namespace

result<manifest> modsel::parse_manifest(std::string_view                content,
                                        const std::filesystem::path& file) {
    MODSEL_E_SCOPE(e_parse_file{file});
    auto            normalized = normalize_whitespace(content);
    manifest_parser parser;

    int line_no = 0;
    for (auto line : split_lines(normalized)) {
        ++line_no;
        MODSEL_E_SCOPE(e_parse_line{line_no});
        BOOST_LEAF_AUTO(toks, tokenize_line(line));
        if (toks.tokens.empty()) {
            continue;
        }
        BOOST_LEAF_CHECK(parser.parse_line(toks, line_no));
    }

    if (parser.current_block) {
        return new_error(errc::manifest_parse,
                         e_parse_line{parser.block_line},
                         e_human_message{
                             neo::ufmt("unterminated '{}' block", *parser.current_block)});
    }
    if (parser.out.module_path.empty()) {
        return new_error(errc::manifest_parse,
                         e_human_message{"expected a module directive in the manifest"});
    }
    return std::move(parser.out);
}

result<void> modsel::require_transitive_manifest(const manifest&              man,
                                                 const std::filesystem::path& file) {
    if (man.lang_version >= lang_version{1, 17}) {
        return {};
    }
    return new_error(errc::outdated_manifest,
                     e_parse_file{file},
                     e_human_message{neo::ufmt("manifest declares language version {}, but "
                                               "version 1.17 or later is required",
                                               man.lang_version.to_string())},
                     e_remediation{neo::ufmt("Fix {} with 'go mod tidy -go=1.17'", file.string())});
}
