// Stand-in backing process. Accepts the same arguments as dock-worker and
// behaves according to FAKE_SERVICE_MODE:
//   healthy    GET /health answers 200 (default)
//   unhealthy  GET /health answers 503 forever
//   silent     never opens the port
//   crash      exits with code 3 right away
//   slow       answers 200 only after FAKE_SERVICE_DELAY_MS
// If FAKE_SERVICE_PID_FILE is set the process appends its pid to that file.

#include <CLI/CLI.hpp>
#include <httplib.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <thread>

static httplib::Server* g_server = nullptr;
static volatile std::sig_atomic_t g_stop = 0;

void signal_handler(int) {
    g_stop = 1;
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char** argv) {
    std::string model;
    int port = 0;
    std::string host = "127.0.0.1";

    CLI::App app("fake-service");
    app.add_option("--model", model)->required();
    app.add_option("--port", port)->required();
    app.add_option("--host", host);
    app.allow_extras();
    CLI11_PARSE(app, argc, argv);

    const char* mode_env = std::getenv("FAKE_SERVICE_MODE");
    std::string mode = mode_env ? mode_env : "healthy";

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    if (const char* pid_file = std::getenv("FAKE_SERVICE_PID_FILE")) {
        std::ofstream out(pid_file, std::ios::app);
        out << getpid() << "\n";
    }

    if (mode == "crash") {
        return 3;
    }

    if (mode == "silent") {
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return 0;
    }

    auto start = std::chrono::steady_clock::now();
    int delay_ms = 0;
    if (mode == "slow") {
        const char* delay_env = std::getenv("FAKE_SERVICE_DELAY_MS");
        delay_ms = delay_env ? std::atoi(delay_env) : 500;
    }

    httplib::Server server;
    server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (mode == "unhealthy" || elapsed < delay_ms) {
            res.status = 503;
            res.set_content("{\"status\":\"starting\"}", "application/json");
            return;
        }
        res.set_content("{\"status\":\"ok\",\"model\":\"" + model + "\"}", "application/json");
    });

    g_server = &server;
    bool ok = server.listen(host, port);
    g_server = nullptr;
    return ok || g_stop ? 0 : 1;
}
