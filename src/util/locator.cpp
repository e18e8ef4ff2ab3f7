#include <dotkeep/locator.hpp>
#include <dotkeep/log.hpp>

#include <cstdlib>
#include <system_error>

namespace dotkeep {

namespace fs = std::filesystem;

static const char* kAppDir = "dotkeep";

EnvLookup system_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* val = std::getenv(name.c_str());
        if (!val) return std::nullopt;
        return std::string(val);
    };
}

// Non-empty environment value, or nullopt
static std::optional<std::string> env_value(const EnvLookup& env, const std::string& name) {
    auto val = env(name);
    if (!val || val->empty()) return std::nullopt;
    return val;
}

// XDG base directories must be absolute; relative values are ignored.
static std::optional<fs::path> xdg_dir(const EnvLookup& env, const std::string& name) {
    auto val = env_value(env, name);
    if (!val) return std::nullopt;
    fs::path p(*val);
    if (!p.is_absolute()) {
        log::debug("ignoring relative %s '%s'", name.c_str(), val->c_str());
        return std::nullopt;
    }
    return p;
}

static fs::path absolute_or_self(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

Result<fs::path> resolve_config_dir(const LayoutOverrides& overrides, const EnvLookup& env) {
    if (overrides.config_dir && !overrides.config_dir->empty()) {
        return Result<fs::path>::ok(absolute_or_self(*overrides.config_dir));
    }
    if (auto val = env_value(env, "DOTKEEP_CONFIG_DIR")) {
        return Result<fs::path>::ok(absolute_or_self(*val));
    }
    if (auto xdg = xdg_dir(env, "XDG_CONFIG_HOME")) {
        return Result<fs::path>::ok(*xdg / kAppDir);
    }
    if (auto home = env_value(env, "HOME")) {
        return Result<fs::path>::ok(fs::path(*home) / ".config" / kAppDir);
    }
    return DotkeepError{DotkeepError::NoHome,
        "cannot determine path to home directory",
        "set HOME, XDG_CONFIG_HOME or DOTKEEP_CONFIG_DIR"};
}

std::optional<fs::path> resolve_data_dir(const LayoutOverrides& overrides, const EnvLookup& env) {
    if (overrides.data_dir && !overrides.data_dir->empty()) {
        return absolute_or_self(*overrides.data_dir);
    }
    if (auto val = env_value(env, "DOTKEEP_DATA_DIR")) {
        return absolute_or_self(*val);
    }
    if (auto xdg = xdg_dir(env, "XDG_DATA_HOME")) {
        return *xdg / kAppDir;
    }
    if (auto home = env_value(env, "HOME")) {
        return fs::path(*home) / ".local" / "share" / kAppDir;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DirLayout
// ---------------------------------------------------------------------------

DirLayout DirLayout::under(const fs::path& config_root, const fs::path& data_root) {
    DirLayout layout;
    layout.config_dir = config_root;
    layout.config_file = config_root / "config.toml";
    layout.hooks_dir = config_root / "hooks";
    layout.ignores_dir = config_root / "ignores";
    layout.repos_dir = data_root / "repos";
    return layout;
}

Result<DirLayout> DirLayout::resolve(const LayoutOverrides& overrides, const EnvLookup& env) {
    auto config_root = resolve_config_dir(overrides, env);
    if (config_root.is_err()) return std::move(config_root).error();

    auto data_root = resolve_data_dir(overrides, env);
    if (!data_root) {
        log::debug("no data directory available, using configuration directory");
        data_root = config_root.value();
    }

    auto layout = DirLayout::under(config_root.value(), *data_root);
    log::debug("configuration directory located at '%s'", layout.config_dir.c_str());
    log::debug("configuration file located at '%s'", layout.config_file.c_str());
    log::debug("hook script directory located at '%s'", layout.hooks_dir.c_str());
    log::debug("repository directory located at '%s'", layout.repos_dir.c_str());
    return Result<DirLayout>::ok(std::move(layout));
}

// ---------------------------------------------------------------------------
// Locator
// ---------------------------------------------------------------------------

fs::path Locator::hook_script_path(const std::string& script) const {
    return hooks_dir_path() / script;
}

fs::path Locator::ignore_file_path(const std::string& repo_name) const {
    return ignores_dir_path() / (repo_name + ".ignore");
}

fs::path Locator::repo_store_path(const std::string& repo_name) const {
    return repos_dir_path() / (repo_name + ".git");
}

DefaultLocator::DefaultLocator(DirLayout layout)
    : layout_(std::move(layout)) {}

Result<DefaultLocator> DefaultLocator::locate(const LayoutOverrides& overrides,
                                              const EnvLookup& env) {
    auto layout = DirLayout::resolve(overrides, env);
    if (layout.is_err()) return std::move(layout).error();
    return Result<DefaultLocator>::ok(DefaultLocator(std::move(layout).value()));
}

Status DefaultLocator::ensure_config_dir_exists() const {
    for (const auto* dir : {&layout_.config_dir, &layout_.hooks_dir,
                            &layout_.ignores_dir, &layout_.repos_dir}) {
        std::error_code ec;
        if (fs::is_directory(*dir, ec)) continue;

        fs::create_directories(*dir, ec);
        if (ec) {
            return DotkeepError{DotkeepError::IO,
                "cannot create directory '" + dir->string() + "': " + ec.message(),
                "", dir->string(), 0};
        }
        log::debug("created directory '%s'", dir->c_str());
    }
    return ok_status();
}

} // namespace dotkeep
