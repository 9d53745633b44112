#include <iostream>
#include <iomanip>
#include <sstream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>
#include <dock/cli_parser.h>
#include <dock/console_sink.h>
#include <dock/host.h>
#include <dock/server.h>
#include <dock/version.h>

using namespace dock;

// Global flag for signal handling
static std::atomic<bool> g_shutdown_requested(false);

// Ctrl+C and SIGTERM only set the flag. The main thread tears things down so
// the backing process is terminated with us.
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
#ifdef SIGHUP
    } else if (signal == SIGHUP) {
        // Ignore SIGHUP so the server survives its terminal closing
        return;
#endif
    }
}

static void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGHUP
    std::signal(SIGHUP, signal_handler);
#endif
}

static HostOptions make_host_options(const AppConfig& config) {
    HostOptions options;
    options.data_dir = config.data_dir;
    options.catalog_path = config.catalog;
    options.python = config.python;
    options.log_level = config.log_level;
    options.supervisor.health_check_attempts = config.health_attempts;
    options.supervisor.health_check_interval = std::chrono::milliseconds(config.health_interval_ms);
    options.session.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
    return options;
}

static std::string format_gb(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0 * 1024.0) << " GB";
    return oss.str();
}

static int run_list(Host& host) {
    json models = host.list_models();
    std::cout << std::left << std::setw(28) << "ID" << std::setw(16) << "TASK"
              << std::setw(12) << "STATE" << std::setw(40) << "NAME" << "COMPATIBILITY" << std::endl;
    for (const auto& model : models) {
        std::string compatibility = model["compatible"].get<bool>()
            ? "ok" : model["reason"].get<std::string>();
        std::cout << std::left << std::setw(28) << model["id"].get<std::string>()
                  << std::setw(16) << model["task_type"].get<std::string>()
                  << std::setw(12) << model["state"].get<std::string>()
                  << std::setw(40) << model["name"].get<std::string>()
                  << compatibility << std::endl;
    }
    return 0;
}

static int run_system(Host& host) {
    const SystemSpecs& specs = host.system_specs();
    std::cout << "OS:      " << specs.os_name << " " << specs.os_version << std::endl;
    std::cout << "CPU:     " << (specs.cpu_model.empty() ? "unknown" : specs.cpu_model)
              << " (" << specs.cpu_cores << " cores)" << std::endl;
    std::cout << "Memory:  " << format_gb(specs.used_memory) << " used of "
              << format_gb(specs.total_memory) << std::endl;
    if (specs.gpus.empty()) {
        std::cout << "GPUs:    none detected" << std::endl;
    }
    for (const auto& gpu : specs.gpus) {
        std::cout << "GPU:     " << gpu.name << ", " << format_gb(gpu.vram_used) << " used of "
                  << format_gb(gpu.vram_total) << " VRAM, driver " << gpu.driver_version << std::endl;
    }
    return 0;
}

static int run_serve(Host& host, const AppConfig& config) {
    std::cout << "Starting ModelDock..." << std::endl;
    std::cout << "  Version: " << DOCK_VERSION_STRING << std::endl;
    std::cout << "  Port: " << config.port << std::endl;
    std::cout << "  Host: " << config.host << std::endl;
    std::cout << "  Log level: " << config.log_level << std::endl;

    Server server(host, config.port, config.host, config.log_level);

    std::atomic<bool> finished(false);
    std::thread watcher([&server, &finished]() {
        while (!finished) {
            if (g_shutdown_requested) {
                std::cout << "\n[Server] Shutdown signal received, exiting..." << std::endl;
                server.stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    try {
        server.run();
    } catch (const std::exception&) {
        finished = true;
        watcher.join();
        throw;
    }

    finished = true;
    watcher.join();
    return 0;
}

static int run_launch(Host& host, const AppConfig& config) {
    int port = host.launch(config.model);
    std::cout << config.model << " is running on http://127.0.0.1:" << port
              << " (Ctrl+C to stop)" << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (host.supervisor().state() != ServiceState::RUNNING) {
            std::cerr << "Backing service for " << config.model << " exited" << std::endl;
            return 1;
        }
    }

    std::cout << "\nStopping " << config.model << "..." << std::endl;
    host.stop();
    return 0;
}

int main(int argc, char** argv) {
    try {
        CLIParser parser;

        parser.parse(argc, argv);

        // Check if we should continue (false for --help, --version, or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        auto config = parser.get_config();
        Host host(make_host_options(config));
        install_signal_handlers();

        if (config.command == "serve") {
            return run_serve(host, config);
        }
        if (config.command == "list") {
            return run_list(host);
        }
        if (config.command == "system") {
            return run_system(host);
        }

        // Ctrl+C makes the sink refuse the next event, which stops the operation
        ConsoleEventSink console(std::cout, host.is_debug(), &g_shutdown_requested);

        if (config.command == "install") {
            host.install(config.model, console);
            return 0;
        }
        if (config.command == "launch") {
            return run_launch(host, config);
        }
        if (config.command == "chat") {
            host.load(config.model);
            host.generate(config.prompt, console, config.max_tokens);
            return 0;
        }
        if (config.command == "remove") {
            host.remove(config.model);
            std::cout << "Removed " << config.model << std::endl;
            return 0;
        }

        std::cerr << "Error: unknown command " << config.command << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
