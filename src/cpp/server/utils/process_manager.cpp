#include "dock/utils/process_manager.h"
#include "dock/utils/path_utils.h"
#include "dock/error_types.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace dock {
namespace utils {

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

static std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (auto& s : strings) {
        result.push_back(const_cast<char*>(s.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

// Reports errno to the parent through the close-on-exec pipe and exits.
// Only async-signal-safe calls are allowed here.
[[noreturn]] static void child_fail(int err_fd) {
    int err = errno;
    ssize_t ignored = write(err_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

std::string ProcessManager::resolve_executable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        if (access(executable.c_str(), X_OK) != 0) {
            throw ProcessSpawnException("Executable not found or not executable: " + executable);
        }
        return executable;
    }

    std::string resolved = find_in_path(executable);
    if (resolved.empty()) {
        throw ProcessSpawnException("Executable not found in PATH: " + executable);
    }
    return resolved;
}

std::vector<std::string> ProcessManager::build_environment(
    const std::vector<std::pair<std::string, std::string>>& env_vars) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool overridden = false;
        for (const auto& [key, value] : env_vars) {
            if (entry.compare(0, key.size() + 1, key + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(entry);
        }
    }
    for (const auto& [key, value] : env_vars) {
        env.push_back(key + "=" + value);
    }
    return env;
}

ProcessHandle ProcessManager::start_process(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir,
    bool inherit_output,
    const std::vector<std::pair<std::string, std::string>>& env_vars) {

    std::string exe_path = resolve_executable(executable);

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argv_strings;
    argv_strings.push_back(exe_path);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<char*> argv = to_c_array(argv_strings);

    std::vector<std::string> env_strings = build_environment(env_vars);
    std::vector<char*> envp = to_c_array(env_strings);

    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        throw ProcessSpawnException(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw ProcessSpawnException(std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        close(err_pipe[0]);

        if (!inherit_output) {
            int null_fd = open("/dev/null", O_WRONLY);
            if (null_fd >= 0) {
                dup2(null_fd, STDOUT_FILENO);
                dup2(null_fd, STDERR_FILENO);
                close(null_fd);
            }
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            child_fail(err_pipe[1]);
        }

        execve(argv[0], argv.data(), envp.data());
        child_fail(err_pipe[1]);
    }

    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        waitpid(pid, nullptr, 0);
        throw ProcessSpawnException("Failed to start " + exe_path + ": " + std::strerror(child_errno));
    }

    ProcessHandle handle;
    handle.pid = pid;
    return handle;
}

bool ProcessManager::is_running(ProcessHandle& handle) {
    if (handle.pid <= 0 || handle.exited) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(handle.pid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }

    handle.exited = true;
    if (result == handle.pid) {
        handle.exit_code = decode_wait_status(status);
    }
    return false;
}

int ProcessManager::get_exit_code(ProcessHandle& handle) {
    if (is_running(handle)) {
        return -1;
    }
    return handle.exit_code;
}

void ProcessManager::stop_process(ProcessHandle& handle, std::chrono::milliseconds grace_period) {
    if (!is_running(handle)) {
        return;
    }

    kill(handle.pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace_period;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_running(handle)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cerr << "[ProcessManager] Process " << handle.pid
              << " did not exit gracefully, forcing termination..." << std::endl;
    kill(handle.pid, SIGKILL);

    int status = 0;
    if (waitpid(handle.pid, &status, 0) == handle.pid) {
        handle.exit_code = decode_wait_status(status);
    }
    handle.exited = true;
}

int ProcessManager::run_process_with_output(
    const std::string& executable,
    const std::vector<std::string>& args,
    OutputLineCallback on_line,
    const std::string& working_dir) {

    std::string exe_path = resolve_executable(executable);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(exe_path);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<char*> argv = to_c_array(argv_strings);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw ProcessSpawnException(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw ProcessSpawnException(std::string("Failed to create pipe: ") + std::strerror(err));
    }
    fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw ProcessSpawnException(std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            child_fail(err_pipe[1]);
        }

        execve(argv[0], argv.data(), environ);
        child_fail(err_pipe[1]);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close(out_pipe[0]);
        waitpid(pid, nullptr, 0);
        throw ProcessSpawnException("Failed to start " + exe_path + ": " + std::strerror(child_errno));
    }

    std::string pending;
    char buffer[4096];
    bool keep_reading = true;
    while (keep_reading) {
        ssize_t count = read(out_pipe[0], buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(count));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (on_line && !on_line(line)) {
                kill(pid, SIGKILL);
                keep_reading = false;
                break;
            }
        }
    }
    if (keep_reading && !pending.empty() && on_line) {
        on_line(pending);
    }
    close(out_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_wait_status(status);
}

} // namespace utils
} // namespace dock
