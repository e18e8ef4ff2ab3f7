#include <dotkeep/process.hpp>
#include <dotkeep/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dotkeep {

static std::vector<const char*> make_argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

namespace {

// Failure report written by a child that never reached exec
struct SpawnFailure {
    int stage;  // 0 = chdir, 1 = exec
    int err;
};

} // anonymous namespace

static bool open_status_pipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Child side: enter working_dir and exec, or report why not and exit.
[[noreturn]] static void exec_child(const std::vector<const char*>& argv,
                                    const std::string& working_dir, int status_fd) {
    SpawnFailure failure{0, 0};
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
        failure = SpawnFailure{0, errno};
    } else {
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        failure = SpawnFailure{1, errno};
    }
    ssize_t n = write(status_fd, &failure, sizeof(failure));
    (void)n;
    _exit(127);
}

// Parent side: an empty read means the status pipe was closed by a
// successful exec.
static std::optional<DotkeepError> read_spawn_failure(int status_fd,
                                                     const std::vector<std::string>& args,
                                                     const std::string& working_dir) {
    SpawnFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(status_fd, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(status_fd);
    if (n != static_cast<ssize_t>(sizeof(failure))) return std::nullopt;

    if (failure.stage == 0) {
        return DotkeepError{DotkeepError::Execution,
            "cannot enter '" + working_dir + "': " + strerror(failure.err)};
    }
    return DotkeepError{DotkeepError::Execution,
        "cannot execute '" + args[0] + "': " + strerror(failure.err)};
}

static void reap(pid_t pid) {
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "run_command: empty args"};
    }

    auto argv = make_argv(args);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return DotkeepError{DotkeepError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return DotkeepError{DotkeepError::IO,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    int status_pipe[2];
    if (!open_status_pipe(status_pipe)) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return DotkeepError{DotkeepError::IO,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        close(status_pipe[0]); close(status_pipe[1]);
        return DotkeepError{DotkeepError::IO,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close(status_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        exec_child(argv, working_dir, status_pipe[1]);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    if (auto failure = read_spawn_failure(status_pipe[0], args, working_dir)) {
        reap(pid);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        return *failure;
    }

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return DotkeepError{DotkeepError::Execution,
                    "command timed out after " + std::to_string(timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            return Result<CommandResult>::ok(
                CommandResult{decode_status(status), std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            int saved = errno;
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return DotkeepError{DotkeepError::IO,
                std::string("waitpid failed: ") + strerror(saved)};
        }

        usleep(1000);  // 1ms
    }
}

Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir) {
    if (args.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "run_interactive: empty args"};
    }

    auto argv = make_argv(args);
    std::fflush(stdout);
    std::fflush(stderr);

    int status_pipe[2];
    if (!open_status_pipe(status_pipe)) {
        return DotkeepError{DotkeepError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(status_pipe[0]); close(status_pipe[1]);
        return DotkeepError{DotkeepError::IO,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        close(status_pipe[0]);
        exec_child(argv, working_dir, status_pipe[1]);
    }

    close(status_pipe[1]);
    if (auto failure = read_spawn_failure(status_pipe[0], args, working_dir)) {
        reap(pid);
        return *failure;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return DotkeepError{DotkeepError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }

    int code = decode_status(status);
    log::trace("%s exited with %d", args[0].c_str(), code);
    return Result<int>::ok(code);
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string word;
    while (in >> word) parts.push_back(word);
    return parts;
}

} // namespace dotkeep
