#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <cstdio>
#  include <sstream>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstring>
#endif

#include <chrono>

namespace platform {

#ifdef _WIN32

// No separate stderr capture here; both streams land in stdout_data.
ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& cwd,
                          int /*timeout_ms*/) {
    ProcessResult result;

    std::ostringstream cmdline;
    if (!cwd.empty()) {
        cmdline << "cd /d \"" << cwd.string() << "\" && ";
    }
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    cmdline << " 2>&1";

    FILE* pipe = _popen(cmdline.str().c_str(), "r");
    if (!pipe) {
        result.stderr_data = "failed to start " + program;
        return result;
    }
    result.launched = true;

    char buf[PROCESS_READ_BUF_SIZE];
    while (fgets(buf, sizeof(buf), pipe) != nullptr) {
        result.stdout_data += buf;
    }
    result.exit_code = _pclose(pipe);
    if (result.exit_code != 0) {
        result.stderr_data = result.stdout_data;
    }
    return result;
}

#else // Unix

static void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    // Wait up to the grace period for a clean exit
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += 100) {
        int status;
        if (waitpid(pid, &status, WNOHANG) == pid) return;
        sleep_ms(100);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& cwd,
                          int timeout_ms) {
    ProcessResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    // Build everything the child needs before forking
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    const std::string cwd_str = cwd.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        if (!cwd_str.empty() && chdir(cwd_str.c_str()) != 0) {
            const char msg[] = "cannot change to working directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(126);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        const char msg[] = "exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    // Parent
    result.launched = true;
    close(out_pipe[1]);
    close(err_pipe[1]);

    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;
    char buf[PROCESS_READ_BUF_SIZE];
    auto start = std::chrono::steady_clock::now();

    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= timeout_ms) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(timeout_ms - elapsed);
        }

        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;  // timeout check at loop head

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0) continue;
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    if (result.timed_out) {
        terminate_child(pid);
        result.exit_code = -1;
        return result;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

#endif

} // namespace platform
