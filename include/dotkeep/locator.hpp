#pragma once

#include <dotkeep/result.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace dotkeep {

// Environment lookup used during layout resolution. The default reads the
// process environment; tests supply a map-backed lookup.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup system_env();

// Explicit directory overrides (e.g. from command-line flags).
struct LayoutOverrides {
    std::optional<std::filesystem::path> config_dir;
    std::optional<std::filesystem::path> data_dir;
};

// Configuration root: override > $DOTKEEP_CONFIG_DIR > $XDG_CONFIG_HOME/dotkeep
// > $HOME/.config/dotkeep. Fails with NoHome when nothing applies.
Result<std::filesystem::path> resolve_config_dir(const LayoutOverrides& overrides,
                                                 const EnvLookup& env = system_env());

// Data root: override > $DOTKEEP_DATA_DIR > $XDG_DATA_HOME/dotkeep
// > $HOME/.local/share/dotkeep. Returns nullopt when nothing applies.
std::optional<std::filesystem::path> resolve_data_dir(const LayoutOverrides& overrides,
                                                      const EnvLookup& env = system_env());

// Resolved absolute paths for one subsystem instance.
struct DirLayout {
    std::filesystem::path config_dir;
    std::filesystem::path config_file;
    std::filesystem::path hooks_dir;
    std::filesystem::path ignores_dir;
    std::filesystem::path repos_dir;

    // Build the standard layout below a configuration root and a data root
    static DirLayout under(const std::filesystem::path& config_root,
                           const std::filesystem::path& data_root);

    // Resolve from overrides and environment. The data root falls back to the
    // configuration root when it cannot be determined on its own.
    static Result<DirLayout> resolve(const LayoutOverrides& overrides = {},
                                     const EnvLookup& env = system_env());
};

// Path resolution capability. Path queries are pure joins that never touch
// the filesystem; only ensure_config_dir_exists() has side effects.
class Locator {
public:
    virtual ~Locator() = default;

    virtual const std::filesystem::path& config_dir() const = 0;
    virtual const std::filesystem::path& config_document_path() const = 0;
    virtual const std::filesystem::path& hooks_dir_path() const = 0;
    virtual const std::filesystem::path& ignores_dir_path() const = 0;
    virtual const std::filesystem::path& repos_dir_path() const = 0;

    std::filesystem::path hook_script_path(const std::string& script) const;
    std::filesystem::path ignore_file_path(const std::string& repo_name) const;
    std::filesystem::path repo_store_path(const std::string& repo_name) const;

    // Create the configuration root and its required subdirectories
    virtual Status ensure_config_dir_exists() const = 0;
};

// Filesystem-backed locator over a resolved DirLayout
class DefaultLocator : public Locator {
public:
    explicit DefaultLocator(DirLayout layout);

    // Resolve the layout and build a locator in one step
    static Result<DefaultLocator> locate(const LayoutOverrides& overrides = {},
                                         const EnvLookup& env = system_env());

    const std::filesystem::path& config_dir() const override { return layout_.config_dir; }
    const std::filesystem::path& config_document_path() const override { return layout_.config_file; }
    const std::filesystem::path& hooks_dir_path() const override { return layout_.hooks_dir; }
    const std::filesystem::path& ignores_dir_path() const override { return layout_.ignores_dir; }
    const std::filesystem::path& repos_dir_path() const override { return layout_.repos_dir; }

    Status ensure_config_dir_exists() const override;

    const DirLayout& layout() const { return layout_; }

private:
    DirLayout layout_;
};

} // namespace dotkeep
