#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace dock {
namespace utils {

struct ProcessHandle {
    pid_t pid = 0;
    bool exited = false;  // set once the child has been reaped
    int exit_code = -1;
};

// Receives one line of combined stdout/stderr; return false to kill the child
using OutputLineCallback = std::function<bool(const std::string&)>;

class ProcessManager {
public:
    // Fork and exec a child process. Throws ProcessSpawnException if the
    // executable cannot be found or exec fails.
    static ProcessHandle start_process(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir = "",
        bool inherit_output = false,
        const std::vector<std::pair<std::string, std::string>>& env_vars = {});

    // SIGTERM, wait up to grace_period, then SIGKILL. Always reaps the child.
    static void stop_process(ProcessHandle& handle,
                             std::chrono::milliseconds grace_period = std::chrono::milliseconds(5000));

    // Non-blocking liveness check; reaps and records the exit code if the child is gone
    static bool is_running(ProcessHandle& handle);

    // Exit code of a reaped child, -1 while it is still running
    static int get_exit_code(ProcessHandle& handle);

    // Run to completion, streaming each output line to the callback. Returns the exit code.
    static int run_process_with_output(
        const std::string& executable,
        const std::vector<std::string>& args,
        OutputLineCallback on_line,
        const std::string& working_dir = "");

private:
    static std::string resolve_executable(const std::string& executable);
    static std::vector<std::string> build_environment(
        const std::vector<std::pair<std::string, std::string>>& env_vars);
};

} // namespace utils
} // namespace dock
