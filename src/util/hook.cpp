#include <dotkeep/hook.hpp>
#include <dotkeep/log.hpp>

#include <cctype>
#include <system_error>

#include <unistd.h>

namespace dotkeep {

namespace fs = std::filesystem;

Result<CommandResult> ScriptRunner::run(const fs::path& script, const fs::path& working_dir) {
    std::vector<std::string> args;
    if (::access(script.c_str(), X_OK) == 0) {
        args = {script.string()};
    } else {
        args = {"sh", script.string()};
    }
    return run_command(args, working_dir.string());
}

HookOptions HookOptions::from_settings(const Settings& settings, fs::path working_dir) {
    HookOptions opts;
    opts.mode = settings.run_hook;
    opts.strict = settings.strict_hooks;
    opts.fatal_failures = settings.fatal_hooks;
    opts.post_on_failure = settings.post_on_failure;
    opts.working_dir = std::move(working_dir);
    return opts;
}

const char* outcome_name(HookOutcome::Kind kind) {
    switch (kind) {
        case HookOutcome::Executed:       return "executed";
        case HookOutcome::Skipped:        return "skipped";
        case HookOutcome::NotFound:       return "not found";
        case HookOutcome::ExecutionError: return "execution error";
    }
    return "unknown";
}

bool HookOutcome::failed() const {
    switch (kind) {
        case Executed:       return exit_code != 0;
        case Skipped:        return false;
        case NotFound:       return true;
        case ExecutionError: return true;
    }
    return false;
}

std::optional<DotkeepError> HookOutcome::error() const {
    std::string name = script.filename().string();
    switch (kind) {
        case Executed:
            if (exit_code == 0) return std::nullopt;
            return DotkeepError{DotkeepError::Execution,
                "hook '" + name + "' exited with status " + std::to_string(exit_code)};
        case Skipped:
            return DotkeepError{DotkeepError::UserDeclined,
                "hook '" + name + "' was declined"};
        case NotFound:
            return DotkeepError{DotkeepError::ScriptNotFound,
                "hook script '" + script.string() + "' not found",
                "create the script or remove it from the [hooks] table"};
        case ExecutionError:
            return DotkeepError{DotkeepError::Execution,
                "hook '" + name + "' failed: " + message};
    }
    return std::nullopt;
}

bool HookReport::failed() const {
    for (const auto& o : outcomes) {
        if (o.failed()) return true;
    }
    return false;
}

std::optional<DotkeepError> HookReport::first_error() const {
    for (const auto& o : outcomes) {
        if (o.failed()) return o.error();
    }
    return std::nullopt;
}

size_t HookReport::count(HookOutcome::Kind kind) const {
    size_t n = 0;
    for (const auto& o : outcomes) {
        if (o.kind == kind) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Working directory expansion
// ---------------------------------------------------------------------------

static bool is_var_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

Result<std::string> expand_workdir(const std::string& raw, const EnvLookup& env) {
    std::string out;
    size_t i = 0;

    if (!raw.empty() && raw[0] == '~' && (raw.size() == 1 || raw[1] == '/')) {
        auto home = env("HOME");
        if (!home || home->empty()) {
            return DotkeepError{DotkeepError::NoHome,
                "cannot expand '~' in '" + raw + "': HOME is not set"};
        }
        out = *home;
        i = 1;
    }

    while (i < raw.size()) {
        char c = raw[i];
        if (c != '$') {
            out += c;
            ++i;
            continue;
        }

        std::string name;
        if (i + 1 < raw.size() && raw[i + 1] == '{') {
            size_t close = raw.find('}', i + 2);
            if (close == std::string::npos) {
                return DotkeepError{DotkeepError::InvalidArg,
                    "unterminated '${' in '" + raw + "'"};
            }
            name = raw.substr(i + 2, close - i - 2);
            i = close + 1;
        } else {
            size_t j = i + 1;
            while (j < raw.size() && is_var_char(raw[j])) ++j;
            name = raw.substr(i + 1, j - i - 1);
            i = j;
        }

        // A lone '$' is kept as-is
        if (name.empty()) {
            out += '$';
            continue;
        }

        auto val = env(name);
        if (!val) {
            return DotkeepError{DotkeepError::InvalidArg,
                "undefined variable '" + name + "' in '" + raw + "'"};
        }
        out += *val;
    }
    return Result<std::string>::ok(out);
}

// ---------------------------------------------------------------------------
// HookRunner
// ---------------------------------------------------------------------------

HookRunner::HookRunner(const ConfigManager& manager, const DocumentStore& store,
                       ProcessRunner& runner, Pager& pager, Prompter& prompter,
                       HookOptions options, EnvLookup env)
    : manager_(manager), store_(store), runner_(runner), pager_(pager),
      prompter_(prompter), options_(std::move(options)), env_(std::move(env)) {}

Result<HookReport> HookRunner::run_phase(const std::string& command, HookPhase phase) {
    if (options_.mode == HookMode::Never) {
        log::debug("hooks disabled, skipping %s hooks of '%s'", phase_name(phase), command.c_str());
        return Result<HookReport>::ok(HookReport{});
    }

    auto hooks = manager_.hooks_for(command);
    if (hooks.is_err()) return std::move(hooks).error();
    return run_hooks(command, phase, hooks.value());
}

Result<GuardedReport> HookRunner::run_guarded(const std::string& command,
                                              const std::function<Status()>& body) {
    GuardedReport report;

    std::vector<ResolvedHook> hooks;
    if (options_.mode != HookMode::Never) {
        auto found = manager_.hooks_for(command);
        if (found.is_err()) return std::move(found).error();
        hooks = std::move(found).value();
    }

    auto pre = run_hooks(command, HookPhase::Pre, hooks);
    if (pre.is_err()) return std::move(pre).error();
    report.pre = std::move(pre).value();

    if (report.pre.aborted) {
        log::warn("not running '%s': a pre hook failed", command.c_str());
        return Result<GuardedReport>::ok(std::move(report));
    }

    Status status = body();
    report.command_ran = true;
    if (status.is_err()) {
        report.command_error = status.error();
        if (!options_.post_on_failure) {
            log::debug("'%s' failed, skipping post hooks", command.c_str());
            return Result<GuardedReport>::ok(std::move(report));
        }
    }

    auto post = run_hooks(command, HookPhase::Post, hooks);
    if (post.is_err()) return std::move(post).error();
    report.post = std::move(post).value();

    return Result<GuardedReport>::ok(std::move(report));
}

Result<HookReport> HookRunner::run_hooks(const std::string& command, HookPhase phase,
                                         const std::vector<ResolvedHook>& hooks) {
    HookReport report;

    for (const auto& hook : hooks) {
        if (hook.phase != phase) continue;

        auto outcome = run_one(hook);
        if (outcome.is_err()) return std::move(outcome).error();
        report.outcomes.push_back(std::move(outcome).value());

        const auto& last = report.outcomes.back();
        if (last.kind == HookOutcome::NotFound && options_.strict) {
            return *last.error();
        }
        if (last.failed() && options_.fatal_failures) {
            log::warn("stopping %s hooks of '%s' after failure", phase_name(phase), command.c_str());
            report.aborted = true;
            break;
        }
    }
    return Result<HookReport>::ok(std::move(report));
}

Result<HookOutcome> HookRunner::run_one(const ResolvedHook& hook) {
    HookOutcome outcome{hook.phase, hook.script, HookOutcome::Executed, 0, ""};
    std::string name = hook.script.filename().string();

    // Scripts must sit directly inside the hooks directory
    fs::path hooks_dir = manager_.locator().hooks_dir_path().lexically_normal();
    fs::path script = hook.script.lexically_normal();
    if (name.empty() || script.parent_path() != hooks_dir) {
        outcome.kind = HookOutcome::ExecutionError;
        outcome.message = "script is outside the hooks directory";
        log::warn("refusing to run '%s': %s", hook.script.c_str(), outcome.message.c_str());
        return Result<HookOutcome>::ok(std::move(outcome));
    }

    if (!store_.exists(hook.script)) {
        outcome.kind = HookOutcome::NotFound;
        outcome.message = "no such file";
        log::warn("hook script '%s' not found", hook.script.c_str());
        return Result<HookOutcome>::ok(std::move(outcome));
    }

    fs::path workdir = options_.working_dir;
    if (hook.workdir) {
        auto expanded = expand_workdir(*hook.workdir, env_);
        if (expanded.is_err()) {
            outcome.kind = HookOutcome::ExecutionError;
            outcome.message = expanded.error().message;
            log::warn("cannot run hook '%s': %s", name.c_str(), outcome.message.c_str());
            return Result<HookOutcome>::ok(std::move(outcome));
        }
        fs::path dir(expanded.value());
        workdir = (dir.is_relative() && !options_.working_dir.empty())
            ? options_.working_dir / dir : dir;
    }

    if (options_.mode == HookMode::Prompt) {
        auto contents = store_.read_text(hook.script);
        if (contents.is_err()) {
            outcome.kind = HookOutcome::ExecutionError;
            outcome.message = contents.error().message;
            return Result<HookOutcome>::ok(std::move(outcome));
        }

        auto paged = pager_.page(hook.script, contents.value());
        if (paged.is_err()) {
            outcome.kind = HookOutcome::ExecutionError;
            outcome.message = paged.error().message;
            log::warn("cannot show hook '%s': %s", name.c_str(), outcome.message.c_str());
            return Result<HookOutcome>::ok(std::move(outcome));
        }

        std::string shown_dir = workdir.empty() ? "." : workdir.string();
        auto accepted = prompter_.confirm(
            "Run '" + name + "' at '" + shown_dir + "'? [a]ccept/[d]eny");
        if (accepted.is_err()) return std::move(accepted).error();
        if (!accepted.value()) {
            outcome.kind = HookOutcome::Skipped;
            log::info("skipped %s hook '%s'", phase_name(hook.phase), name.c_str());
            return Result<HookOutcome>::ok(std::move(outcome));
        }
    }

    log::debug("running %s hook '%s' in '%s'", phase_name(hook.phase), name.c_str(),
               workdir.empty() ? "." : workdir.c_str());

    auto result = runner_.run(hook.script, workdir);
    if (result.is_err()) {
        outcome.kind = HookOutcome::ExecutionError;
        outcome.message = result.error().message;
        log::warn("hook '%s' could not be run: %s", name.c_str(), outcome.message.c_str());
        return Result<HookOutcome>::ok(std::move(outcome));
    }

    const auto& cmd = result.value();
    outcome.exit_code = cmd.exit_code;
    outcome.message = cmd.stderr_str;

    log::block(log::Debug, "stdout of '" + name + "'", cmd.stdout_str);
    log::block(log::Debug, "stderr of '" + name + "'", cmd.stderr_str);
    if (cmd.exit_code == 0) {
        log::info("%s hook '%s' finished", phase_name(hook.phase), name.c_str());
    } else {
        log::warn("%s hook '%s' exited with status %d", phase_name(hook.phase),
                  name.c_str(), cmd.exit_code);
    }
    return Result<HookOutcome>::ok(std::move(outcome));
}

} // namespace dotkeep
