#include <dotkeep/config.hpp>
#include <dotkeep/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>

namespace dotkeep {

const char* hook_mode_name(HookMode mode) {
    switch (mode) {
        case HookMode::Never:  return "never";
        case HookMode::Always: return "always";
        case HookMode::Prompt: return "prompt";
    }
    return "unknown";
}

std::optional<HookMode> parse_hook_mode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "never") return HookMode::Never;
    if (lower == "always") return HookMode::Always;
    if (lower == "prompt") return HookMode::Prompt;
    return std::nullopt;
}

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return DotkeepError{DotkeepError::Parse,
            "settings parse error: " + std::string(e.description()), "", "",
            static_cast<int>(src.begin.line), static_cast<int>(src.begin.column)};
    }

    Settings settings;
    auto tbl = doc["settings"].as_table();
    if (!tbl) return Result<Settings>::ok(settings);

    if (auto v = (*tbl)["run_hook"].value<std::string>()) {
        auto mode = parse_hook_mode(*v);
        if (!mode) {
            return DotkeepError{DotkeepError::InvalidArg,
                "invalid run_hook value '" + *v + "'",
                "expected one of: prompt, always, never"};
        }
        settings.run_hook = *mode;
    }
    if (auto v = (*tbl)["pager"].value<std::string>()) settings.pager = *v;
    if (auto v = (*tbl)["strict_hooks"].value<bool>()) settings.strict_hooks = *v;
    if (auto v = (*tbl)["fatal_hooks"].value<bool>()) settings.fatal_hooks = *v;
    if (auto v = (*tbl)["post_on_failure"].value<bool>()) settings.post_on_failure = *v;

    return Result<Settings>::ok(settings);
}

Status Settings::apply_env(const EnvLookup& env) {
    if (auto v = env("DOTKEEP_RUN_HOOK"); v && !v->empty()) {
        auto mode = parse_hook_mode(*v);
        if (!mode) {
            return DotkeepError{DotkeepError::InvalidArg,
                "invalid DOTKEEP_RUN_HOOK value '" + *v + "'",
                "expected one of: prompt, always, never"};
        }
        run_hook = *mode;
        log::debug("hook mode set to '%s' from environment", hook_mode_name(run_hook));
    }
    if (auto v = env("PAGER"); v && !v->empty() && pager.empty()) {
        pager = *v;
    }
    return ok_status();
}

} // namespace dotkeep
