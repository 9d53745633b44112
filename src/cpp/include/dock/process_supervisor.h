#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "model_store.h"
#include "model_types.h"
#include "utils/process_manager.h"

namespace dock {

enum class ServiceState {
    IDLE,
    STARTING,
    HEALTH_CHECKING,
    RUNNING,
    STOPPED,
    FAILED
};

std::string service_state_to_string(ServiceState state);

// Owns one running backing process. Destroying the handle terminates it.
class ServiceHandle {
public:
    ServiceHandle(utils::ProcessHandle process, int port, const std::string& model_id,
                  std::chrono::milliseconds stop_grace_period);
    ~ServiceHandle();

    ServiceHandle(const ServiceHandle&) = delete;
    ServiceHandle& operator=(const ServiceHandle&) = delete;

    pid_t pid() const { return process_.pid; }
    int port() const { return port_; }
    const std::string& model_id() const { return model_id_; }

    bool is_alive();
    int exit_code();

private:
    utils::ProcessHandle process_;
    int port_;
    std::string model_id_;
    std::chrono::milliseconds stop_grace_period_;
};

struct SupervisorOptions {
    int health_check_attempts = 30;
    std::chrono::milliseconds health_check_interval{1000};
    std::chrono::milliseconds stop_grace_period{5000};
    bool inherit_output = false;  // let the child write to our console
};

// Runs at most one backing process at a time. Launching a model stops
// whatever was running before, starts the backend on a free local port and
// polls GET /health until it answers or the attempt budget runs out.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const ModelStore& store, SupervisorOptions options = SupervisorOptions());
    ~ProcessSupervisor();

    // Returns the port the service listens on. Throws NotFoundException if the
    // weights are missing, ProcessSpawnException if the backend cannot be
    // started or exits during startup, HealthCheckTimeoutException otherwise.
    int launch(const ModelDescriptor& model);

    // Terminates the running service, if any
    void stop();

    ServiceState state();

    // One health request to the running service. False if nothing is running.
    bool check_health();

    int port();  // 0 when nothing is running
    std::string running_model();
    pid_t pid();

    static int choose_port();

private:
    void wait_for_ready(ServiceHandle& handle, const std::string& service_name);
    void reap_if_exited_locked();

    const ModelStore& store_;
    SupervisorOptions options_;

    // Held for the whole of launch() so two launches never interleave
    std::mutex mutex_;
    std::unique_ptr<ServiceHandle> handle_;
    std::atomic<ServiceState> state_{ServiceState::IDLE};
};

} // namespace dock
