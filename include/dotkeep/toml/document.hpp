#pragma once

#include <dotkeep/result.hpp>
#include <dotkeep/toml/scanner.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dotkeep {

// Conditions under which a repository is bootstrapped
struct BootstrapEntry {
    std::optional<std::string> clone;   // URL to clone from
    std::optional<std::string> os;      // "any", "unix", "macos" or "windows"
    std::optional<std::vector<std::string>> users;
    std::optional<std::vector<std::string>> hosts;

    bool empty() const {
        return !clone && !os && !users && !hosts;
    }

    bool operator==(const BootstrapEntry& o) const {
        return clone == o.clone && os == o.os && users == o.users && hosts == o.hosts;
    }
};

// One tracked repository, stored as [repos.<name>]
struct RepoEntry {
    std::string name;
    // Work tree override. Absent means a plain self-contained repository.
    std::optional<std::string> target;
    std::optional<std::string> branch;
    std::optional<std::string> remote;
    bool workdir_home = false;  // work tree is the user's home directory
    std::optional<BootstrapEntry> bootstrap;

    RepoEntry() = default;
    explicit RepoEntry(std::string n, std::optional<std::string> t = std::nullopt)
        : name(std::move(n)), target(std::move(t)) {}

    // Effective work tree: `target` when set, else `home` for workdir_home
    // repositories, else none.
    std::optional<std::string> work_tree(const std::string& home) const {
        if (target) return target;
        if (workdir_home) return home;
        return std::nullopt;
    }

    bool operator==(const RepoEntry& o) const {
        return name == o.name && target == o.target && branch == o.branch &&
               remote == o.remote && workdir_home == o.workdir_home &&
               bootstrap == o.bootstrap;
    }
};

enum class HookPhase { Pre, Post };

const char* phase_name(HookPhase phase);

struct HookAction {
    HookPhase phase;
    std::string script;                  // bare filename inside the hooks directory
    std::optional<std::string> workdir;  // expanded at execution time

    bool operator==(const HookAction& o) const {
        return phase == o.phase && script == o.script && workdir == o.workdir;
    }
};

// Hook configuration of one command, in declared order
struct HookEntry {
    std::string command;
    std::vector<HookAction> actions;

    HookEntry() = default;
    explicit HookEntry(std::string cmd) : command(std::move(cmd)) {}

    HookEntry& pre(std::string script, std::optional<std::string> workdir = std::nullopt);
    HookEntry& post(std::string script, std::optional<std::string> workdir = std::nullopt);
};

// Format-preserving configuration document.
//
// The document keeps the scanned TomlLayout as its live tree and derives the
// repos/hooks views from it after every change. Mutations rewrite only the
// nodes they touch; everything else, comments and blank lines included, is
// rendered back exactly as it was read. A mutation that fails leaves the
// document untouched.
class ConfigDocument {
public:
    ConfigDocument();

    static Result<ConfigDocument> parse(const std::string& text,
                                        const std::string& origin = "<input>");

    // Document written by first-time setup: empty [repos] and [hooks] tables
    static ConfigDocument skeleton();

    std::string to_string() const;
    const std::string& origin() const { return origin_; }

    // Repository section
    std::optional<RepoEntry> get_repo(const std::string& name) const;
    const std::vector<RepoEntry>& repos() const { return repos_; }
    Status add_repo(const RepoEntry& entry);
    Status remove_repo(const std::string& name);
    Status rename_repo(const std::string& from, const std::string& to);

    // Command hook section
    std::optional<HookEntry> get_hook(const std::string& command) const;
    const std::vector<HookEntry>& hooks() const { return hooks_; }
    Status set_hook(const HookEntry& entry);
    Status remove_hook(const std::string& command);

private:
    TomlLayout layout_;
    std::string origin_;
    std::vector<RepoEntry> repos_;
    std::vector<HookEntry> hooks_;

    // Validate an edited layout and derive a new document from it
    Result<ConfigDocument> rebuild(TomlLayout candidate) const;
};

} // namespace dotkeep
