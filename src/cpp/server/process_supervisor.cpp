#include "dock/process_supervisor.h"
#include "dock/backends/backend_utils.h"
#include "dock/error_types.h"
#include "dock/utils/http_client.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

namespace dock {

using backends::BackendSpec;
using backends::BackendUtils;
using utils::ProcessManager;

std::string service_state_to_string(ServiceState state) {
    switch (state) {
        case ServiceState::IDLE: return "idle";
        case ServiceState::STARTING: return "starting";
        case ServiceState::HEALTH_CHECKING: return "health_checking";
        case ServiceState::RUNNING: return "running";
        case ServiceState::STOPPED: return "stopped";
        case ServiceState::FAILED: return "failed";
    }
    return "unknown";
}

ServiceHandle::ServiceHandle(utils::ProcessHandle process, int port, const std::string& model_id,
                             std::chrono::milliseconds stop_grace_period)
    : process_(process), port_(port), model_id_(model_id), stop_grace_period_(stop_grace_period) {}

ServiceHandle::~ServiceHandle() {
    if (process_.pid > 0 && !process_.exited) {
        std::cout << "[ProcessSupervisor] Stopping " << model_id_ << " (PID: " << process_.pid << ")" << std::endl;
        ProcessManager::stop_process(process_, stop_grace_period_);
    }
}

bool ServiceHandle::is_alive() {
    return ProcessManager::is_running(process_);
}

int ServiceHandle::exit_code() {
    return ProcessManager::get_exit_code(process_);
}

ProcessSupervisor::ProcessSupervisor(const ModelStore& store, SupervisorOptions options)
    : store_(store), options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

int ProcessSupervisor::choose_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw ProcessSpawnException(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string error = std::strerror(errno);
        close(fd);
        throw ProcessSpawnException("Failed to bind an ephemeral port: " + error);
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        std::string error = std::strerror(errno);
        close(fd);
        throw ProcessSpawnException("Failed to read ephemeral port: " + error);
    }

    int port = ntohs(addr.sin_port);
    close(fd);
    return port;
}

int ProcessSupervisor::launch(const ModelDescriptor& model) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (handle_) {
        std::cout << "[ProcessSupervisor] Replacing running service " << handle_->model_id() << std::endl;
        handle_.reset();
        state_ = ServiceState::STOPPED;
    }

    state_ = ServiceState::STARTING;

    try {
        if (!store_.has_weights(model)) {
            throw NotFoundException("Model " + model.id + " is not installed (no weights at " +
                                    store_.weights_path(model) + ")");
        }

        const BackendSpec& spec = BackendUtils::spec_for(model.task_type);
        std::string executable = BackendUtils::get_backend_binary_path(spec);
        int port = choose_port();

        std::vector<std::string> args = {
            "--model", store_.weights_path(model),
            "--port", std::to_string(port)
        };

        std::cout << "[ProcessSupervisor] Starting " << executable << " for " << model.id
                  << " on port " << port << std::endl;

        auto process = ProcessManager::start_process(executable, args, "", options_.inherit_output);
        auto handle = std::make_unique<ServiceHandle>(process, port, model.id, options_.stop_grace_period);

        state_ = ServiceState::HEALTH_CHECKING;
        wait_for_ready(*handle, spec.log_name());

        handle_ = std::move(handle);
        state_ = ServiceState::RUNNING;
        std::cout << "[ProcessSupervisor] " << model.id << " ready on port " << port << std::endl;
        return port;
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Launch of " << model.id << " failed: " << e.what() << std::endl;
        state_ = ServiceState::FAILED;
        throw;
    }
}

void ProcessSupervisor::wait_for_ready(ServiceHandle& handle, const std::string& service_name) {
    std::string health_url = "http://127.0.0.1:" + std::to_string(handle.port()) + "/health";
    int timeout_ms = static_cast<int>(options_.health_check_interval.count());
    auto start = std::chrono::steady_clock::now();

    for (int attempt = 1; attempt <= options_.health_check_attempts; ++attempt) {
        if (!handle.is_alive()) {
            throw ProcessSpawnException(service_name + " exited during startup with code " +
                                        std::to_string(handle.exit_code()));
        }

        if (utils::HttpClient::is_reachable(health_url, timeout_ms)) {
            return;
        }

        // Attempts are paced against the start time so a slow health request does not stretch the budget
        std::this_thread::sleep_until(start + attempt * options_.health_check_interval);
    }

    throw HealthCheckTimeoutException(service_name, options_.health_check_attempts);
}

void ProcessSupervisor::reap_if_exited_locked() {
    if (handle_ && !handle_->is_alive()) {
        std::cerr << "[ProcessSupervisor] " << handle_->model_id() << " exited unexpectedly with code "
                  << handle_->exit_code() << std::endl;
        handle_.reset();
        state_ = ServiceState::STOPPED;
    }
}

void ProcessSupervisor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        handle_.reset();
        state_ = ServiceState::STOPPED;
    }
}

ServiceState ProcessSupervisor::state() {
    // A launch in progress owns the mutex; report its phase without waiting
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (lock.owns_lock()) {
        reap_if_exited_locked();
    }
    return state_.load();
}

bool ProcessSupervisor::check_health() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_if_exited_locked();
    if (!handle_) {
        return false;
    }
    std::string health_url = "http://127.0.0.1:" + std::to_string(handle_->port()) + "/health";
    return utils::HttpClient::is_reachable(health_url,
                                           static_cast<int>(options_.health_check_interval.count()));
}

int ProcessSupervisor::port() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return 0;
    }
    reap_if_exited_locked();
    return handle_ ? handle_->port() : 0;
}

std::string ProcessSupervisor::running_model() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return "";
    }
    reap_if_exited_locked();
    return handle_ ? handle_->model_id() : "";
}

pid_t ProcessSupervisor::pid() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return 0;
    }
    reap_if_exited_locked();
    return handle_ ? handle_->pid() : 0;
}

} // namespace dock
