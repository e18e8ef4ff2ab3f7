#pragma once

#include <dotkeep/locator.hpp>
#include <dotkeep/result.hpp>
#include <optional>
#include <string>

namespace dotkeep {

// How hook scripts are gated before they run
enum class HookMode { Never, Always, Prompt };

const char* hook_mode_name(HookMode mode);

// Parse "never", "always" or "prompt" (case-insensitive)
std::optional<HookMode> parse_hook_mode(const std::string& name);

// Behavior settings from the [settings] table of config.toml:
//
//   [settings]
//   run_hook = "prompt"
//   pager = "less -R"
//   strict_hooks = false
//   fatal_hooks = false
//   post_on_failure = true
struct Settings {
    HookMode run_hook = HookMode::Prompt;
    std::string pager;          // empty: built-in listing
    bool strict_hooks = false;  // missing hook script aborts the phase
    bool fatal_hooks = false;   // failing hook aborts the phase
    bool post_on_failure = true;

    // Parse from TOML string. Unknown keys are ignored.
    static Result<Settings> parse(const std::string& toml_str);

    // Environment overrides: DOTKEEP_RUN_HOOK and PAGER
    Status apply_env(const EnvLookup& env = system_env());
};

} // namespace dotkeep
