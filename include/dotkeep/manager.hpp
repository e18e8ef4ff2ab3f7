#pragma once

#include <dotkeep/config.hpp>
#include <dotkeep/locator.hpp>
#include <dotkeep/store.hpp>
#include <dotkeep/toml/document.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dotkeep {

// A hook action with its script resolved against the hooks directory
struct ResolvedHook {
    HookPhase phase;
    std::filesystem::path script;
    std::optional<std::string> workdir;
};

// Facade over the locator and the document store. Every operation reads the
// current document, applies one change and writes it back; a failed change
// never reaches the disk.
class ConfigManager {
public:
    ConfigManager(const Locator& locator, DocumentStore& store);

    // Create the directory layout and a skeleton config.toml. Running it on
    // an already bootstrapped layout changes nothing.
    Status bootstrap();

    // Repositories
    Status add_repository(const RepoEntry& entry);
    Status add_repository(const std::string& name,
                          std::optional<std::string> target = std::nullopt);
    Status remove_repository(const std::string& name);
    Status rename_repository(const std::string& from, const std::string& to);
    Result<std::optional<RepoEntry>> get_repository(const std::string& name) const;
    Result<std::vector<RepoEntry>> list_repositories() const;

    // Hooks of `command` in declared order. Script existence is not checked.
    Result<std::vector<ResolvedHook>> hooks_for(const std::string& command) const;
    Status set_command_hooks(const HookEntry& entry);
    Status remove_command_hooks(const std::string& command);

    // Replace the ignore file of `repo` with one pattern per line
    Status write_ignore_file(const std::string& repo,
                             const std::vector<std::string>& patterns);

    // [settings] of the current document, environment overrides applied
    Result<Settings> settings(const EnvLookup& env = system_env()) const;

    // Current document; an absent config file reads as an empty document
    Result<ConfigDocument> load() const;

    const Locator& locator() const { return locator_; }

private:
    const Locator& locator_;
    DocumentStore& store_;

    Status save(const ConfigDocument& doc);
};

// Repository names become path components; reject anything that is not a
// single plain component.
Status validate_repo_name(const std::string& name);

} // namespace dotkeep
