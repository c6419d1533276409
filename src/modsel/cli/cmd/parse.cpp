#include "./output.hpp"

#include "../options.hpp"

#include <modsel/error/on_error.hpp>
#include <modsel/manifest/manifest.hpp>
#include <modsel/manifest/workspace.hpp>
#include <modsel/sum/store.hpp>
#include <modsel/util/fs/io.hpp>

#include <neo/assert.hpp>
#include <nlohmann/json.hpp>

using namespace modsel;

using json = nlohmann::json;

namespace {

json replaces_as_json(const replace_map& replaces) {
    auto ret = json::array();
    for (auto& [from, entry] : replaces) {
        json item = {{"from_path", entry.from_path}};
        if (entry.from_version) {
            item["from_version"] = *entry.from_version;
        }
        if (entry.is_local()) {
            item["local_dir"] = *entry.local_dir;
        } else {
            item["to_path"]    = entry.to_path;
            item["to_version"] = entry.to_version.value_or("");
        }
        ret.push_back(std::move(item));
    }
    return ret;
}

json manifest_as_json(const manifest& man) {
    auto reqs = json::array();
    for (auto& req : man.requirements) {
        reqs.push_back({
            {"path", req.path},
            {"version", req.version},
            {"indirect", req.indirect},
            {"line", req.line},
        });
    }
    return json{
        {"module", man.module_path},
        {"go", man.lang_version.to_string()},
        {"require", std::move(reqs)},
        {"replace", replaces_as_json(man.replaces)},
    };
}

json workspace_as_json(const workspace& work) {
    auto uses = json::array();
    for (auto& use : work.uses) {
        uses.push_back({
            {"directory", use.directory},
            {"manifest", use.manifest_path.string()},
            {"line", use.line},
        });
    }
    return json{
        {"go", work.lang_version.to_string()},
        {"use", std::move(uses)},
        {"replace", replaces_as_json(work.replaces)},
    };
}

json sums_as_json(const std::vector<sum_entry>& entries) {
    auto ret = json::array();
    for (auto& ent : entries) {
        ret.push_back({
            {"path", ent.path},
            {"version", ent.version},
            {"hash", ent.hash},
        });
    }
    return ret;
}

}  // namespace

namespace modsel::cli::cmd {

int parse(const options& opts) {
    auto& fpath   = opts.parse.file;
    auto  content = modsel::read_file(fpath);
    switch (opts.parse.kind) {
    case parse_kind::mod:
        write_command_output(opts, manifest_as_json(parse_manifest(content, fpath).value()));
        return 0;
    case parse_kind::work:
        write_command_output(opts, workspace_as_json(parse_workspace(content, fpath).value()));
        return 0;
    case parse_kind::sum:
        write_command_output(opts, sums_as_json(parse_sum_file(content, fpath).value()));
        return 0;
    }
    neo::unreachable();
}

}  // namespace modsel::cli::cmd
