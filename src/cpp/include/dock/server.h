#pragma once

// Define thread pool count BEFORE including httplib.h
#ifndef CPPHTTPLIB_THREAD_POOL_COUNT
#define CPPHTTPLIB_THREAD_POOL_COUNT 8
#endif

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "event_channel.h"
#include "host.h"

namespace dock {

// HTTP adapter over Host. Every route lives under /api/v1/; install and
// generate stream their events as server-sent events.
class Server {
public:
    Server(Host& host, int port, const std::string& bind_host, const std::string& log_level);
    ~Server();

    // Start the server; blocks until stop()
    void run();

    // Stop the server
    void stop();

    bool is_running() const { return running_; }

    // Binds to an OS-assigned port instead of the configured one. Returns the port.
    int bind_to_any_port();

private:
    void setup_routes(httplib::Server& web_server);
    void setup_http_logger(httplib::Server& web_server);
    void log_request(const httplib::Request& req);
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    // Endpoint handlers
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);
    void handle_status(const httplib::Request& req, httplib::Response& res);
    void handle_system(const httplib::Request& req, httplib::Response& res);
    void handle_install(const httplib::Request& req, httplib::Response& res);
    void handle_launch(const httplib::Request& req, httplib::Response& res);
    void handle_stop(const httplib::Request& req, httplib::Response& res);
    void handle_load(const httplib::Request& req, httplib::Response& res);
    void handle_generate(const httplib::Request& req, httplib::Response& res);
    void handle_remove(const httplib::Request& req, httplib::Response& res);
    void handle_shutdown(const httplib::Request& req, httplib::Response& res);

    // Runs producer on its own thread and relays what it writes into the
    // channel to the client. Exceptions from the producer become an `error` event.
    void stream_events(httplib::Response& res, std::function<void(EventChannel&)> producer);

    static void send_error(httplib::Response& res, const std::exception& e);
    static std::string require_model(const json& request);

    Host& host_;
    int port_;
    std::string bind_host_;
    std::string log_level_;
    bool bound_ = false;

    std::unique_ptr<httplib::Server> http_server_;
    std::thread shutdown_thread_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> running_;
};

} // namespace dock
