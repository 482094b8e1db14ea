#include "dirgen.h"
#include "workers/process_util.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace process {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Everything the child needs is built before fork(); the child only calls
// async-signal-safe functions.
struct ExecImage {
    std::vector<std::string> args;
    std::vector<std::string> env_strings;
    std::vector<char*> argv;
    std::vector<char*> envp;

    ExecImage(const std::vector<std::string>& command, const std::map<std::string, std::string>& env)
        : args(command) {
        for (auto& a : args) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);

        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            std::string key = entry.substr(0, entry.find('='));
            if (env.count(key) == 0) {
                env_strings.push_back(entry);
            }
        }
        for (const auto& [key, value] : env) {
            env_strings.push_back(key + "=" + value);
        }
        for (auto& s : env_strings) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);
    }
};

} // namespace

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += " ";
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += "\"" + arg + "\"";
        } else {
            out += arg;
        }
    }
    return out;
}

pid_t spawn(const std::vector<std::string>& argv, const SpawnOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        throw ProcessLaunchError("Empty command");
    }

    ExecImage image(argv, options.env);

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        throw ProcessLaunchError("Failed to create pipe: " + std::string(strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw ProcessLaunchError("Failed to fork: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);

        if (options.quiet) {
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) < 0) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvpe(image.argv[0], image.argv.data(), image.envp.data());

        // If we get here, exec failed
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        throw ProcessLaunchError("Failed to execute " + argv[0] + ": " + strerror(child_errno));
    }

    dprintf(1, "Spawned pid %d: %s", pid, join_command(argv).c_str());
    return pid;
}

CommandResult run_command(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        throw ProcessLaunchError("Empty command");
    }

    ExecImage image(argv, {});

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw ProcessLaunchError("Failed to create pipes: " + std::string(strerror(errno)));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw ProcessLaunchError("Failed to create pipes: " + std::string(strerror(err)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        throw ProcessLaunchError("Failed to fork: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // dup2 clears close-on-exec on the new descriptors
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(image.argv[0], image.argv.data());
        _exit(127);  // exec failed
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool stdout_open = true, stderr_open = true;
    char buffer[4096];

    while (stdout_open || stderr_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        int nfds = 0;
        if (stdout_open) fds[nfds++] = {stdout_pipe[0], POLLIN, 0};
        if (stderr_open) fds[nfds++] = {stderr_pipe[0], POLLIN, 0};

        int rc = poll(fds, nfds, static_cast<int>(std::min<long long>(remaining, 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < nfds; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t got = read(fds[i].fd, buffer, sizeof(buffer));
            bool is_stdout = fds[i].fd == stdout_pipe[0];
            if (got > 0) {
                (is_stdout ? result.stdout_output : result.stderr_output).append(buffer, got);
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                (is_stdout ? stdout_open : stderr_open) = false;
            }
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    if (result.timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        LOG_WARN("Command timed out after " + std::to_string(timeout.count()) + "s: " + join_command(argv));
        return result;
    }

    waitpid(pid, &status, 0);
    result.exit_code = decode_status(status);
    dprintf(2, "Command exited %d: %s", result.exit_code, join_command(argv).c_str());
    return result;
}

std::optional<int> try_reap(pid_t pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    int status = 0;
    pid_t result = waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        return decode_status(status);
    }
    if (result < 0 && errno == ECHILD) {
        // Already reaped elsewhere
        return -1;
    }
    return std::nullopt;
}

void terminate(pid_t pid, std::chrono::milliseconds grace) {
    if (pid <= 0) {
        return;
    }
    if (try_reap(pid)) {
        return;
    }

    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(pid)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    dprintf(1, "Force killing pid %d", pid);
    kill(pid, SIGKILL);
    int status;
    waitpid(pid, &status, 0);
}

} // namespace process
