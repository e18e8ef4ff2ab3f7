#include <dotkeep/toml/document.hpp>
#include <dotkeep/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <string_view>

namespace dotkeep {

const char* phase_name(HookPhase phase) {
    switch (phase) {
        case HookPhase::Pre:  return "pre";
        case HookPhase::Post: return "post";
    }
    return "unknown";
}

HookEntry& HookEntry::pre(std::string script, std::optional<std::string> workdir) {
    actions.push_back(HookAction{HookPhase::Pre, std::move(script), std::move(workdir)});
    return *this;
}

HookEntry& HookEntry::post(std::string script, std::optional<std::string> workdir) {
    actions.push_back(HookAction{HookPhase::Post, std::move(script), std::move(workdir)});
    return *this;
}

using NamePath = std::vector<std::string>;

static NamePath full_path(const TomlTable& table, const TomlEntry& entry) {
    NamePath path = key_names(table.key);
    for (const auto& seg : entry.key) path.push_back(seg.name);
    return path;
}

static bool starts_with_path(const NamePath& path, const NamePath& prefix) {
    if (path.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

static std::string render_tables(const TomlLayout& layout, size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < layout.tables.size(); ++i) {
        const auto& table = layout.tables[i];
        out += table.decor;
        out += table.header;
        for (const auto& entry : table.entries) {
            out += entry.decor;
            out += entry.text;
        }
    }
    return out;
}

// Text needed so that a new table starts after a blank line
static std::string table_separator(const std::string& preceding) {
    if (preceding.empty()) return "";
    if (preceding.back() != '\n') return "\n\n";
    if (preceding.size() >= 2 && preceding[preceding.size() - 2] == '\n') return "";
    return "\n";
}

static bool is_blank_line(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

static bool is_comment_line(std::string_view line) {
    auto first = line.find_first_not_of(" \t");
    return first != std::string_view::npos && line[first] == '#';
}

static std::vector<std::string_view> split_lines(const std::string& text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string::npos) ? text.size() : nl + 1;
        lines.emplace_back(text.data() + start, end - start);
        start = end;
    }
    return lines;
}

// Comments in a removed node's decor that are not attached to the node itself
// (separated from it by a blank line). Returns "" when there are none.
static std::string detached_comments(const std::string& decor) {
    auto lines = split_lines(decor);
    size_t attached = lines.size();
    while (attached > 0 && is_comment_line(lines[attached - 1])) --attached;

    std::string detached;
    for (size_t i = 0; i < attached; ++i) detached.append(lines[i]);
    return detached.find('#') == std::string::npos ? "" : detached;
}

static std::string strip_leading_blank_lines(const std::string& decor) {
    size_t pos = 0;
    for (auto line : split_lines(decor)) {
        if (!is_blank_line(line) || line.back() != '\n') break;
        pos += line.size();
    }
    return decor.substr(pos);
}

static bool ends_with_blank_line(const std::string& text) {
    size_t i = text.size();
    if (i == 0 || text[i - 1] != '\n') return false;
    --i;
    while (i > 0 && (text[i - 1] == ' ' || text[i - 1] == '\t' || text[i - 1] == '\r')) --i;
    return i == 0 || text[i - 1] == '\n';
}

// Drop every table and entry at or below `prefix`. Comments that were only
// sitting above a dropped node (not attached to it) move to the next node;
// blank-line separators are normalized so no gap is left behind.
static TomlLayout remove_nodes(const TomlLayout& layout, const NamePath& prefix) {
    TomlLayout out;
    out.bom = layout.bom;
    std::string rendered;
    std::string carry;
    bool after_drop = false;

    auto settle = [&](std::string& decor) {
        if (!after_drop) return;
        if (!carry.empty()) decor = carry + strip_leading_blank_lines(decor);
        if (rendered.empty() || ends_with_blank_line(rendered)) {
            decor = strip_leading_blank_lines(decor);
        }
        carry.clear();
        after_drop = false;
    };

    for (const auto& table : layout.tables) {
        bool is_root = table.key.empty();
        if (!is_root && starts_with_path(key_names(table.key), prefix)) {
            carry += detached_comments(table.decor);
            after_drop = true;
            continue;
        }

        TomlTable kept = table;
        kept.entries.clear();
        settle(kept.decor);
        rendered += kept.decor;
        rendered += kept.header;

        for (const auto& entry : table.entries) {
            if (starts_with_path(full_path(table, entry), prefix)) {
                carry += detached_comments(entry.decor);
                after_drop = true;
                continue;
            }
            TomlEntry e = entry;
            settle(e.decor);
            rendered += e.decor;
            rendered += e.text;
            kept.entries.push_back(std::move(e));
        }
        out.tables.push_back(std::move(kept));
    }

    out.trailer = layout.trailer;
    settle(out.trailer);
    return out;
}

// Append tables at the end of the document, absorbing the trailer so any
// trailing comments stay where they were.
static void append_tables(TomlLayout& layout, std::vector<TomlTable> fresh) {
    if (fresh.empty()) return;
    std::string preceding = layout.render();
    fresh.front().decor = layout.trailer + table_separator(preceding);
    layout.trailer.clear();
    for (auto& table : fresh) layout.tables.push_back(std::move(table));
}

static std::string render_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_string(items[i]);
    }
    out += "]";
    return out;
}

static std::string render_repo(const RepoEntry& repo) {
    std::string text = "[repos." + format_key(repo.name) + "]\n";
    if (repo.target) text += "target = " + quote_string(*repo.target) + "\n";
    if (repo.branch) text += "branch = " + quote_string(*repo.branch) + "\n";
    if (repo.remote) text += "remote = " + quote_string(*repo.remote) + "\n";
    if (repo.workdir_home) text += "workdir_home = true\n";

    if (repo.bootstrap && !repo.bootstrap->empty()) {
        const auto& b = *repo.bootstrap;
        text += "\n[repos." + format_key(repo.name) + ".bootstrap]\n";
        if (b.clone) text += "clone = " + quote_string(*b.clone) + "\n";
        if (b.os) text += "os = " + quote_string(*b.os) + "\n";
        if (b.users) text += "users = " + render_string_array(*b.users) + "\n";
        if (b.hosts) text += "hosts = " + render_string_array(*b.hosts) + "\n";
    }
    return text;
}

static std::string render_hook(const HookEntry& hook) {
    std::string text = format_key(hook.command) + " = [\n";
    for (const auto& action : hook.actions) {
        text += "    { ";
        text += phase_name(action.phase);
        text += " = " + quote_string(action.script);
        if (action.workdir) text += ", workdir = " + quote_string(*action.workdir);
        text += " },\n";
    }
    text += "]\n";
    return text;
}

// Snippets rendered by this file
static Result<TomlLayout> scan_generated(const std::string& text) {
    return scan_toml(text, "<generated>");
}

// ---------------------------------------------------------------------------
// Typed views (decoded with toml++)
// ---------------------------------------------------------------------------

static Result<toml::table> parse_text(const std::string& text, const std::string& origin) {
    try {
        return Result<toml::table>::ok(
            toml::parse(std::string_view{text}, std::string_view{origin}));
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return DotkeepError{DotkeepError::Parse,
            "failed to parse '" + origin + "': " + std::string(e.description()),
            "", origin,
            static_cast<int>(src.begin.line), static_cast<int>(src.begin.column)};
    }
}

// Children of a top-level section, in the order they appear in the text
static NamePath child_order(const TomlLayout& layout, const toml::table& section,
                            const std::string& name) {
    NamePath order;
    auto note = [&order](const std::string& child) {
        if (std::find(order.begin(), order.end(), child) == order.end()) {
            order.push_back(child);
        }
    };

    for (const auto& table : layout.tables) {
        auto table_path = key_names(table.key);
        if (table_path.size() >= 2 && table_path[0] == name) note(table_path[1]);
        for (const auto& entry : table.entries) {
            auto path = full_path(table, entry);
            if (path.size() >= 2 && path[0] == name) note(path[1]);
        }
    }

    // Inline definitions (e.g. repos = { vim = {} }) are not visible as keys
    for (const auto& kv : section) {
        note(std::string(kv.first.str()));
    }
    return order;
}

static std::optional<std::vector<std::string>> string_array(const toml::node* node) {
    if (!node) return std::nullopt;
    auto arr = node->as_array();
    if (!arr) return std::nullopt;

    std::vector<std::string> out;
    for (const auto& el : *arr) {
        if (auto s = el.value<std::string>()) out.push_back(*s);
    }
    return out;
}

static RepoEntry decode_repo(const std::string& name, const toml::node& node) {
    RepoEntry repo(name);
    auto tbl = node.as_table();
    if (!tbl) {
        log::debug("repository '%s' is not a table, ignoring its settings", name.c_str());
        return repo;
    }

    if (auto v = (*tbl)["target"].value<std::string>()) repo.target = *v;
    if (auto v = (*tbl)["branch"].value<std::string>()) repo.branch = *v;
    if (auto v = (*tbl)["remote"].value<std::string>()) repo.remote = *v;
    if (auto v = (*tbl)["workdir_home"].value<bool>()) repo.workdir_home = *v;

    if (auto b = (*tbl)["bootstrap"].as_table()) {
        BootstrapEntry bootstrap;
        if (auto v = (*b)["clone"].value<std::string>()) bootstrap.clone = *v;
        if (auto v = (*b)["os"].value<std::string>()) bootstrap.os = *v;
        bootstrap.users = string_array(b->get("users"));
        bootstrap.hosts = string_array(b->get("hosts"));
        if (!bootstrap.empty()) repo.bootstrap = std::move(bootstrap);
    }
    return repo;
}

static HookEntry decode_hook(const std::string& command, const toml::node& node) {
    HookEntry hook(command);
    auto arr = node.as_array();
    if (!arr) {
        log::debug("hooks for '%s' are not an array, ignoring them", command.c_str());
        return hook;
    }

    for (const auto& el : *arr) {
        auto tbl = el.as_table();
        if (!tbl) continue;

        std::optional<std::string> workdir;
        if (auto w = (*tbl)["workdir"].value<std::string>()) workdir = *w;
        if (auto pre = (*tbl)["pre"].value<std::string>()) hook.pre(*pre, workdir);
        if (auto post = (*tbl)["post"].value<std::string>()) hook.post(*post, workdir);
    }
    return hook;
}

static void decode_views(const toml::table& doc, const TomlLayout& layout,
                         std::vector<RepoEntry>& repos, std::vector<HookEntry>& hooks) {
    repos.clear();
    hooks.clear();

    if (auto section = doc["repos"].as_table()) {
        for (const auto& name : child_order(layout, *section, "repos")) {
            if (auto node = section->get(name)) repos.push_back(decode_repo(name, *node));
        }
    }

    if (auto section = doc["hooks"].as_table()) {
        for (const auto& command : child_order(layout, *section, "hooks")) {
            if (auto node = section->get(command)) hooks.push_back(decode_hook(command, *node));
        }
    }
}

static DotkeepError repo_not_found(const std::string& name, const std::string& origin) {
    return DotkeepError{DotkeepError::NotFound,
        "repository '" + name + "' not found", "", origin, 0};
}

// ---------------------------------------------------------------------------
// ConfigDocument
// ---------------------------------------------------------------------------

ConfigDocument::ConfigDocument()
    : origin_("<new>") {
    layout_.tables.emplace_back();
}

Result<ConfigDocument> ConfigDocument::parse(const std::string& text, const std::string& origin) {
    auto table = parse_text(text, origin);
    if (table.is_err()) return std::move(table).error();

    auto layout = scan_toml(text, origin);
    if (layout.is_err()) return std::move(layout).error();

    ConfigDocument doc;
    doc.origin_ = origin;
    doc.layout_ = std::move(layout).value();
    decode_views(table.value(), doc.layout_, doc.repos_, doc.hooks_);
    return Result<ConfigDocument>::ok(std::move(doc));
}

ConfigDocument ConfigDocument::skeleton() {
    ConfigDocument doc;
    auto layout = scan_toml("[repos]\n\n[hooks]\n", "<skeleton>");
    if (layout.is_ok()) doc.layout_ = std::move(layout).value();
    return doc;
}

std::string ConfigDocument::to_string() const {
    return layout_.render();
}

Result<ConfigDocument> ConfigDocument::rebuild(TomlLayout candidate) const {
    auto table = parse_text(candidate.render(), origin_);
    if (table.is_err()) {
        log::debug("rejecting edit of '%s': %s", origin_.c_str(), table.error().message.c_str());
        return std::move(table).error();
    }

    ConfigDocument next;
    next.origin_ = origin_;
    next.layout_ = std::move(candidate);
    decode_views(table.value(), next.layout_, next.repos_, next.hooks_);
    return Result<ConfigDocument>::ok(std::move(next));
}

std::optional<RepoEntry> ConfigDocument::get_repo(const std::string& name) const {
    for (const auto& repo : repos_) {
        if (repo.name == name) return repo;
    }
    return std::nullopt;
}

Status ConfigDocument::add_repo(const RepoEntry& entry) {
    if (entry.name.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "repository name cannot be empty"};
    }
    if (get_repo(entry.name)) {
        return DotkeepError{DotkeepError::DuplicateRepo,
            "repository '" + entry.name + "' already exists",
            "choose another name or remove the existing repository first", origin_, 0};
    }

    auto snippet = scan_generated(render_repo(entry));
    if (snippet.is_err()) return std::move(snippet).error();
    std::vector<TomlTable> fresh(snippet.value().tables.begin() + 1,
                                 snippet.value().tables.end());

    TomlLayout candidate = layout_;

    // New repository tables go right after the last existing repos table
    size_t insert_at = 0;
    for (size_t i = 1; i < candidate.tables.size(); ++i) {
        const auto& key = candidate.tables[i].key;
        if (!key.empty() && key[0].name == "repos") insert_at = i + 1;
    }

    if (insert_at == 0 || insert_at == candidate.tables.size()) {
        append_tables(candidate, std::move(fresh));
    } else {
        fresh.front().decor = table_separator(render_tables(candidate, insert_at));
        candidate.tables.insert(candidate.tables.begin() + static_cast<std::ptrdiff_t>(insert_at),
                                std::make_move_iterator(fresh.begin()),
                                std::make_move_iterator(fresh.end()));
    }

    auto next = rebuild(std::move(candidate));
    if (next.is_err()) return std::move(next).error();
    *this = std::move(next).value();

    log::debug("added repository '%s' to '%s'", entry.name.c_str(), origin_.c_str());
    return ok_status();
}

Status ConfigDocument::remove_repo(const std::string& name) {
    if (!get_repo(name)) return repo_not_found(name, origin_);

    auto next = rebuild(remove_nodes(layout_, {"repos", name}));
    if (next.is_err()) return std::move(next).error();
    if (next.value().get_repo(name)) {
        return DotkeepError{DotkeepError::InvalidArg,
            "repository '" + name + "' is defined inline and cannot be removed",
            "edit the configuration file by hand", origin_, 0};
    }
    *this = std::move(next).value();

    log::debug("removed repository '%s' from '%s'", name.c_str(), origin_.c_str());
    return ok_status();
}

Status ConfigDocument::rename_repo(const std::string& from, const std::string& to) {
    if (to.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "repository name cannot be empty"};
    }
    if (!get_repo(from)) return repo_not_found(from, origin_);
    if (get_repo(to)) {
        return DotkeepError{DotkeepError::DuplicateRepo,
            "cannot rename '" + from + "': repository '" + to + "' already exists",
            "", origin_, 0};
    }

    TomlLayout candidate = layout_;
    for (auto& table : candidate.tables) {
        auto table_path = key_names(table.key);
        if (table_path.size() >= 2) {
            if (table_path[0] == "repos" && table_path[1] == from) {
                rename_key_segment(table.header, table.key, 1, to);
            }
            continue;
        }

        // [repos] entries name the repo in segment 0, root entries in segment 1
        size_t index = 1 - table_path.size();
        for (auto& entry : table.entries) {
            auto path = full_path(table, entry);
            if (path.size() >= 2 && path[0] == "repos" && path[1] == from) {
                rename_key_segment(entry.text, entry.key, index, to);
            }
        }
    }

    auto next = rebuild(std::move(candidate));
    if (next.is_err()) return std::move(next).error();
    if (!next.value().get_repo(to) || next.value().get_repo(from)) {
        return DotkeepError{DotkeepError::InvalidArg,
            "repository '" + from + "' is defined inline and cannot be renamed",
            "edit the configuration file by hand", origin_, 0};
    }
    *this = std::move(next).value();

    log::debug("renamed repository '%s' to '%s'", from.c_str(), to.c_str());
    return ok_status();
}

std::optional<HookEntry> ConfigDocument::get_hook(const std::string& command) const {
    for (const auto& hook : hooks_) {
        if (hook.command == command) return hook;
    }
    return std::nullopt;
}

Status ConfigDocument::set_hook(const HookEntry& entry) {
    if (entry.command.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "hook command name cannot be empty"};
    }
    if (entry.actions.empty()) {
        return DotkeepError{DotkeepError::InvalidArg,
            "no hook actions given for '" + entry.command + "'",
            "remove the command's hooks instead"};
    }

    auto snippet = scan_generated("[hooks]\n" + render_hook(entry));
    if (snippet.is_err()) return std::move(snippet).error();
    const TomlTable& fresh_table = snippet.value().tables.at(1);

    TomlLayout candidate = layout_;

    // Replace an existing definition in [hooks] in place, keeping its decor
    bool replaced = false;
    for (auto& table : candidate.tables) {
        if (key_names(table.key) != NamePath{"hooks"} || table.is_array) continue;
        for (auto& existing : table.entries) {
            if (existing.key.size() == 1 && existing.key[0].name == entry.command) {
                existing.text = fresh_table.entries.front().text;
                existing.key = fresh_table.entries.front().key;
                replaced = true;
            }
        }
    }

    if (!replaced) {
        // Defined somewhere other than [hooks] (e.g. a root dotted key)
        if (get_hook(entry.command)) {
            candidate = remove_nodes(candidate, {"hooks", entry.command});
        }

        size_t hooks_index = 0;
        for (size_t i = 1; i < candidate.tables.size(); ++i) {
            const auto& table = candidate.tables[i];
            if (!table.is_array && key_names(table.key) == NamePath{"hooks"}) hooks_index = i;
        }

        if (hooks_index == 0) {
            append_tables(candidate, {fresh_table});
        } else {
            TomlEntry fresh = fresh_table.entries.front();
            std::string preceding = render_tables(candidate, hooks_index + 1);
            fresh.decor = (preceding.empty() || preceding.back() == '\n') ? "" : "\n";
            candidate.tables[hooks_index].entries.push_back(std::move(fresh));
        }
    }

    auto next = rebuild(std::move(candidate));
    if (next.is_err()) return std::move(next).error();
    *this = std::move(next).value();

    log::debug("set %zu hook action(s) for '%s'", entry.actions.size(), entry.command.c_str());
    return ok_status();
}

Status ConfigDocument::remove_hook(const std::string& command) {
    if (!get_hook(command)) {
        return DotkeepError{DotkeepError::NotFound,
            "no hooks configured for '" + command + "'", "", origin_, 0};
    }

    auto next = rebuild(remove_nodes(layout_, {"hooks", command}));
    if (next.is_err()) return std::move(next).error();
    if (next.value().get_hook(command)) {
        return DotkeepError{DotkeepError::InvalidArg,
            "hooks for '" + command + "' are defined inline and cannot be removed",
            "edit the configuration file by hand", origin_, 0};
    }
    *this = std::move(next).value();

    log::debug("removed hooks for '%s'", command.c_str());
    return ok_status();
}

} // namespace dotkeep
