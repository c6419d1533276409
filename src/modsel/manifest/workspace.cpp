#include "./workspace.hpp"

#include "./error.hpp"
#include "./tokenize.hpp"

#include <modsel/error/errors.hpp>
#include <modsel/error/on_error.hpp>
#include <modsel/error/result.hpp>
#include <modsel/util/string.hpp>

#include <neo/ufmt.hpp>

#include <optional>

using namespace modsel;

namespace {

auto parse_error(std::string message) {
    return new_error(errc::manifest_parse, e_human_message{std::move(message)});
}

struct workspace_parser {
    std::filesystem::path      base_dir;
    workspace                  out{};
    bool                       seen_go = false;
    std::optional<std::string> current_block{};
    int                        block_line = 0;

    result<void> add_use(std::string_view spelling, int line_no) {
        BOOST_LEAF_AUTO(dir, clean_use_directory(spelling));
        auto manifest_path = (dir.empty() ? base_dir : base_dir / dir) / "go.mod";
        out.uses.push_back(workspace_use{
            .directory     = std::move(dir),
            .manifest_path = manifest_path.lexically_normal(),
            .line          = line_no,
        });
        return {};
    }

    result<void> add_replace(const std::vector<std::string>& tokens) {
        BOOST_LEAF_AUTO(entry, replace_entry::from_tokens(tokens));
        out.replaces.assign(std::move(entry));
        return {};
    }

    result<void> parse_line(const std::vector<std::string>& tokens, int line_no) {
        if (current_block) {
            if (tokens[0] == ")") {
                if (tokens.size() > 1) {
                    return parse_error(neo::ufmt("unexpected token '{}' after ')'", tokens[1]));
                }
                current_block.reset();
                return {};
            }
            if (*current_block == "use") {
                if (tokens.size() != 1) {
                    return parse_error(neo::ufmt("unexpected token '{}' after '{}'",
                                                tokens[1],
                                                tokens[0]));
                }
                return add_use(tokens[0], line_no);
            }
            return add_replace(tokens);
        }

        auto& directive = tokens[0];
        if (directive == "go") {
            if (tokens.size() == 1) {
                return parse_error("expected another token after 'go'");
            }
            if (seen_go) {
                return parse_error("unexpected second 'go' directive");
            }
            if (tokens.size() > 2) {
                return parse_error(
                    neo::ufmt("unexpected token '{}' after '{}'", tokens[2], tokens[1]));
            }
            seen_go = true;
            BOOST_LEAF_AUTO(lv, lang_version::parse(tokens[1]));
            out.lang_version = lv;
            return {};
        } else if (directive == "use" || directive == "replace") {
            if (tokens.size() == 1) {
                return parse_error(neo::ufmt("expected another token after '{}'", directive));
            }
            if (tokens[1] == "(") {
                if (tokens.size() > 2) {
                    return parse_error(neo::ufmt("unexpected token '{}' after '('", tokens[2]));
                }
                current_block = directive;
                block_line    = line_no;
                return {};
            }
            if (directive == "use") {
                if (tokens.size() != 2) {
                    return parse_error("expected path or block in 'use' directive");
                }
                return add_use(tokens[1], line_no);
            }
            return add_replace(std::vector<std::string>(tokens.begin() + 1, tokens.end()));
        }
        return parse_error(neo::ufmt("unexpected directive '{}'", directive));
    }
};

}  // namespace

result<std::string> modsel::clean_use_directory(std::string_view spelling) {
    for (auto& seg : split(spelling, "/")) {
        if (seg == "..") {
            return parse_error(
                neo::ufmt("'use' directive '{}' contains '..', which is not supported", spelling));
        }
    }
    if (spelling.starts_with('/') || std::filesystem::path(spelling).is_absolute()) {
        return parse_error(
            neo::ufmt("'use' directive '{}' is an absolute path, which is not supported",
                      spelling));
    }
    if (spelling.starts_with("./")) {
        spelling.remove_prefix(2);
    } else if (spelling == ".") {
        spelling = "";
    }
    if (spelling.ends_with('/')) {
        spelling.remove_suffix(1);
    }
    return std::string(spelling);
}

result<workspace> modsel::parse_workspace(std::string_view             content,
                                          const std::filesystem::path& file) {
    MODSEL_E_SCOPE(e_parse_file{file});
    auto             normalized = normalize_whitespace(content);
    workspace_parser parser{.base_dir = file.parent_path()};

    int line_no = 0;
    for (auto line : split_lines(normalized)) {
        ++line_no;
        MODSEL_E_SCOPE(e_parse_line{line_no});
        BOOST_LEAF_AUTO(toks, tokenize_line(line));
        if (toks.tokens.empty()) {
            continue;
        }
        BOOST_LEAF_CHECK(parser.parse_line(toks.tokens, line_no));
    }

    if (parser.current_block) {
        return new_error(errc::manifest_parse,
                         e_parse_line{parser.block_line},
                         e_human_message{
                             neo::ufmt("unterminated '{}' block", *parser.current_block)});
    }
    return std::move(parser.out);
}
