// demo_hooks.cpp
//
// A small driver over the configuration and hook core. It bootstraps the
// configuration layout, then runs one of a few subcommands:
//
//     ./demo_hooks list                      # tracked repositories
//     ./demo_hooks add vim ~                 # track a repository
//     ./demo_hooks rename vim nvim
//     ./demo_hooks remove nvim
//     ./demo_hooks hooks bootstrap           # show configured hooks
//     ./demo_hooks run bootstrap             # run a command between its hooks
//
// DOTKEEP_CONFIG_DIR points it at a scratch directory; DOTKEEP_LOG=debug
// shows path resolution and hook output.

#include <dotkeep/hook.hpp>
#include <dotkeep/log.hpp>
#include <dotkeep/manager.hpp>
#include <dotkeep/prompt.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace dotkeep;

static Status list_repos(const ConfigManager& mgr) {
    auto repos = mgr.list_repositories();
    DOTKEEP_TRY(repos);

    const char* home = std::getenv("HOME");
    for (const auto& repo : repos.value()) {
        std::cout << repo.name;
        if (auto tree = repo.work_tree(home ? home : "~")) std::cout << " -> " << *tree;
        std::cout << "  (" << mgr.locator().repo_store_path(repo.name).string() << ")\n";
    }
    return ok_status();
}

static Status show_hooks(const ConfigManager& mgr, const std::string& command) {
    auto hooks = mgr.hooks_for(command);
    DOTKEEP_TRY(hooks);

    if (hooks.value().empty()) {
        std::cout << "no hooks for '" << command << "'\n";
    }
    for (const auto& hook : hooks.value()) {
        std::cout << phase_name(hook.phase) << "  " << hook.script.string();
        if (hook.workdir) std::cout << "  (in " << *hook.workdir << ")";
        std::cout << "\n";
    }
    return ok_status();
}

static Status run_command_hooks(ConfigManager& mgr, const DocumentStore& store,
                                const std::string& command) {
    auto settings = mgr.settings();
    DOTKEEP_TRY(settings);

    std::unique_ptr<Pager> pager;
    if (settings.value().pager.empty()) {
        pager = std::make_unique<StreamPager>(std::cout);
    } else {
        pager = std::make_unique<CommandPager>(settings.value().pager);
    }
    StreamPrompter prompter(std::cin, std::cout);
    ScriptRunner runner;

    HookRunner hooks(mgr, store, runner, *pager, prompter,
                     HookOptions::from_settings(settings.value(), fs::current_path()));

    auto report = hooks.run_guarded(command, [&command]() -> Status {
        std::cout << "running '" << command << "'\n";
        return ok_status();
    });
    DOTKEEP_TRY(report);

    for (const auto* phase : {&report.value().pre, &report.value().post}) {
        for (const auto& outcome : phase->outcomes) {
            std::cout << phase_name(outcome.phase) << "  "
                      << outcome.script.filename().string() << ": "
                      << outcome_name(outcome.kind);
            if (outcome.kind == HookOutcome::Executed) {
                std::cout << " (status " << outcome.exit_code << ")";
            }
            std::cout << "\n";
        }
    }

    if (auto err = report.value().pre.first_error()) {
        if (err->code != DotkeepError::UserDeclined) return *err;
    }
    return ok_status();
}

static Status dispatch(const std::vector<std::string>& args) {
    auto locator = DefaultLocator::locate();
    DOTKEEP_TRY(locator);

    FileStore store;
    ConfigManager mgr(locator.value(), store);
    DOTKEEP_TRY(mgr.bootstrap());

    const std::string cmd = args.empty() ? "list" : args[0];
    auto need = [&args, &cmd](size_t n) -> Status {
        if (args.size() < n + 1) {
            return DotkeepError{DotkeepError::InvalidArg,
                "'" + cmd + "' needs " + std::to_string(n) + " argument(s)"};
        }
        return ok_status();
    };

    if (cmd == "list") return list_repos(mgr);
    if (cmd == "add") {
        DOTKEEP_TRY(need(1));
        std::optional<std::string> target;
        if (args.size() > 2) target = args[2];
        return mgr.add_repository(args[1], target);
    }
    if (cmd == "remove") {
        DOTKEEP_TRY(need(1));
        return mgr.remove_repository(args[1]);
    }
    if (cmd == "rename") {
        DOTKEEP_TRY(need(2));
        return mgr.rename_repository(args[1], args[2]);
    }
    if (cmd == "hooks") {
        DOTKEEP_TRY(need(1));
        return show_hooks(mgr, args[1]);
    }
    if (cmd == "run") {
        DOTKEEP_TRY(need(1));
        return run_command_hooks(mgr, store, args[1]);
    }

    return DotkeepError{DotkeepError::InvalidArg,
        "unknown subcommand '" + cmd + "'",
        "expected one of: list, add, remove, rename, hooks, run"};
}

int main(int argc, char** argv) {
    log::init_from_env();

    std::vector<std::string> args(argv + 1, argv + argc);
    auto result = dispatch(args);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
