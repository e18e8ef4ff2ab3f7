#include <dotkeep/manager.hpp>
#include <dotkeep/log.hpp>

namespace dotkeep {

namespace fs = std::filesystem;

Status validate_repo_name(const std::string& name) {
    if (name.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "repository name cannot be empty"};
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        return DotkeepError{DotkeepError::InvalidArg,
            "invalid repository name '" + name + "'",
            "repository names must not contain '/' or be '.' or '..'"};
    }
    return ok_status();
}

ConfigManager::ConfigManager(const Locator& locator, DocumentStore& store)
    : locator_(locator), store_(store) {}

Result<ConfigDocument> ConfigManager::load() const {
    const auto& path = locator_.config_document_path();
    if (!store_.exists(path)) {
        log::debug("no configuration at '%s', using an empty document", path.c_str());
        return ConfigDocument::parse("", path.string());
    }
    return store_.read(path);
}

Status ConfigManager::save(const ConfigDocument& doc) {
    return store_.write(doc, locator_.config_document_path());
}

Status ConfigManager::bootstrap() {
    DOTKEEP_TRY(locator_.ensure_config_dir_exists());

    const auto& path = locator_.config_document_path();
    if (store_.exists(path)) {
        log::debug("configuration already present at '%s'", path.c_str());
        return ok_status();
    }

    DOTKEEP_TRY(store_.write(ConfigDocument::skeleton(), path));
    log::info("created configuration at '%s'", path.c_str());
    return ok_status();
}

Status ConfigManager::add_repository(const RepoEntry& entry) {
    DOTKEEP_TRY(validate_repo_name(entry.name));

    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    DOTKEEP_TRY(doc.value().add_repo(entry));
    DOTKEEP_TRY(save(doc.value()));
    log::info("added repository '%s'", entry.name.c_str());
    return ok_status();
}

Status ConfigManager::add_repository(const std::string& name, std::optional<std::string> target) {
    return add_repository(RepoEntry(name, std::move(target)));
}

Status ConfigManager::remove_repository(const std::string& name) {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    DOTKEEP_TRY(doc.value().remove_repo(name));
    DOTKEEP_TRY(save(doc.value()));
    log::info("removed repository '%s'", name.c_str());
    return ok_status();
}

Status ConfigManager::rename_repository(const std::string& from, const std::string& to) {
    DOTKEEP_TRY(validate_repo_name(to));

    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    DOTKEEP_TRY(doc.value().rename_repo(from, to));
    DOTKEEP_TRY(save(doc.value()));
    log::info("renamed repository '%s' to '%s'", from.c_str(), to.c_str());
    return ok_status();
}

Result<std::optional<RepoEntry>> ConfigManager::get_repository(const std::string& name) const {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();
    return Result<std::optional<RepoEntry>>::ok(doc.value().get_repo(name));
}

Result<std::vector<RepoEntry>> ConfigManager::list_repositories() const {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();
    return Result<std::vector<RepoEntry>>::ok(doc.value().repos());
}

Result<std::vector<ResolvedHook>> ConfigManager::hooks_for(const std::string& command) const {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    std::vector<ResolvedHook> hooks;
    if (auto entry = doc.value().get_hook(command)) {
        for (const auto& action : entry->actions) {
            hooks.push_back(ResolvedHook{action.phase,
                locator_.hook_script_path(action.script), action.workdir});
        }
    }
    log::debug("%zu hook(s) configured for '%s'", hooks.size(), command.c_str());
    return Result<std::vector<ResolvedHook>>::ok(std::move(hooks));
}

Status ConfigManager::set_command_hooks(const HookEntry& entry) {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    DOTKEEP_TRY(doc.value().set_hook(entry));
    DOTKEEP_TRY(save(doc.value()));
    log::info("configured %zu hook(s) for '%s'", entry.actions.size(), entry.command.c_str());
    return ok_status();
}

Status ConfigManager::remove_command_hooks(const std::string& command) {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    DOTKEEP_TRY(doc.value().remove_hook(command));
    DOTKEEP_TRY(save(doc.value()));
    log::info("removed hooks for '%s'", command.c_str());
    return ok_status();
}

Status ConfigManager::write_ignore_file(const std::string& repo,
                                        const std::vector<std::string>& patterns) {
    DOTKEEP_TRY(validate_repo_name(repo));

    std::string text;
    for (const auto& pattern : patterns) {
        text += pattern;
        text += '\n';
    }

    fs::path path = locator_.ignore_file_path(repo);
    DOTKEEP_TRY(store_.write_text(path, text));
    log::debug("wrote %zu ignore pattern(s) to '%s'", patterns.size(), path.c_str());
    return ok_status();
}

Result<Settings> ConfigManager::settings(const EnvLookup& env) const {
    auto doc = load();
    if (doc.is_err()) return std::move(doc).error();

    auto parsed = Settings::parse(doc.value().to_string());
    if (parsed.is_err()) return std::move(parsed).error();
    DOTKEEP_TRY(parsed.value().apply_env(env));
    return parsed;
}

} // namespace dotkeep
