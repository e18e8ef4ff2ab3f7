#pragma once

#include <dotkeep/config.hpp>
#include <dotkeep/manager.hpp>
#include <dotkeep/process.hpp>
#include <dotkeep/prompt.hpp>
#include <dotkeep/result.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dotkeep {

// Spawns a hook script and waits for it
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual Result<CommandResult> run(const std::filesystem::path& script,
                                      const std::filesystem::path& working_dir) = 0;
};

// Runs executable scripts directly and anything else through sh
class ScriptRunner : public ProcessRunner {
public:
    Result<CommandResult> run(const std::filesystem::path& script,
                              const std::filesystem::path& working_dir) override;
};

struct HookOptions {
    HookMode mode = HookMode::Prompt;
    bool strict = false;          // a missing script fails the whole phase
    bool fatal_failures = false;  // a failing script stops the phase
    bool post_on_failure = true;  // run post hooks after a failed command
    std::filesystem::path working_dir;  // default cwd for scripts

    static HookOptions from_settings(const Settings& settings,
                                     std::filesystem::path working_dir = {});
};

struct HookOutcome {
    enum Kind { Executed, Skipped, NotFound, ExecutionError };

    HookPhase phase;
    std::filesystem::path script;
    Kind kind;
    int exit_code = 0;    // meaningful for Executed
    std::string message;  // reason for NotFound/ExecutionError, captured stderr

    bool failed() const;

    // The error this outcome represents, if any. Skipped maps to UserDeclined.
    std::optional<DotkeepError> error() const;
};

const char* outcome_name(HookOutcome::Kind kind);

struct HookReport {
    std::vector<HookOutcome> outcomes;
    bool aborted = false;  // stopped early under fatal_failures

    bool failed() const;
    std::optional<DotkeepError> first_error() const;
    size_t count(HookOutcome::Kind kind) const;
};

// Hook reports around one guarded command
struct GuardedReport {
    HookReport pre;
    HookReport post;
    bool command_ran = false;
    std::optional<DotkeepError> command_error;
};

// Expand a leading ~ and $VAR / ${VAR} references. Undefined variables are
// an error.
Result<std::string> expand_workdir(const std::string& raw, const EnvLookup& env = system_env());

// Collects, confirms and executes the hooks of a command.
//
// Actions run one at a time in declared order. A missing script or a failing
// script is recorded in the report and the phase moves on, unless strict or
// fatal_failures say otherwise. Errors returned as Result are reserved for
// configuration problems, prompt failures and strict-mode missing scripts.
class HookRunner {
public:
    HookRunner(const ConfigManager& manager, const DocumentStore& store,
               ProcessRunner& runner, Pager& pager, Prompter& prompter,
               HookOptions options, EnvLookup env = system_env());

    Result<HookReport> run_phase(const std::string& command, HookPhase phase);

    // Pre hooks, then `body`, then post hooks. The body is not run when the
    // pre phase was aborted.
    Result<GuardedReport> run_guarded(const std::string& command,
                                      const std::function<Status()>& body);

    const HookOptions& options() const { return options_; }

private:
    const ConfigManager& manager_;
    const DocumentStore& store_;
    ProcessRunner& runner_;
    Pager& pager_;
    Prompter& prompter_;
    HookOptions options_;
    EnvLookup env_;

    Result<HookReport> run_hooks(const std::string& command, HookPhase phase,
                                 const std::vector<ResolvedHook>& hooks);
    Result<HookOutcome> run_one(const ResolvedHook& hook);
};

} // namespace dotkeep
