#include "dock/server.h"
#include "dock/error_types.h"
#include "dock/utils/json_utils.h"
#include "dock/version.h"
#include <chrono>
#include <iostream>

namespace dock {

Server::Server(Host& host, int port, const std::string& bind_host, const std::string& log_level)
    : host_(host), port_(port), bind_host_(bind_host), log_level_(log_level), running_(false) {

    http_server_ = std::make_unique<httplib::Server>();

    // Multi-threaded so a long install or generation never blocks other requests
    http_server_->new_task_queue = [] {
        return new httplib::ThreadPool(CPPHTTPLIB_THREAD_POOL_COUNT);
    };

    if (is_debug()) {
        std::cout << "[Server] HTTP server initialized with thread pool ("
                  << CPPHTTPLIB_THREAD_POOL_COUNT << " threads)" << std::endl;
    }

    setup_routes(*http_server_);
    setup_http_logger(*http_server_);
}

Server::~Server() {
    stop();
    if (shutdown_thread_.joinable()) {
        shutdown_thread_.join();
    }
}

void Server::log_request(const httplib::Request& req) {
    if (req.path != "/api/v1/health" && req.path != "/api/v1/status") {
        std::cout << "[Server PRE-ROUTE] " << req.method << " " << req.path << std::endl;
    }
}

void Server::setup_routes(httplib::Server& web_server) {
    web_server.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response&) {
        if (is_debug()) {
            this->log_request(req);
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    auto register_get = [&web_server](const std::string& endpoint,
                                      std::function<void(const httplib::Request&, httplib::Response&)> handler) {
        web_server.Get("/api/v1/" + endpoint, handler);
    };

    auto register_post = [&web_server](const std::string& endpoint,
                                       std::function<void(const httplib::Request&, httplib::Response&)> handler) {
        web_server.Post("/api/v1/" + endpoint, handler);
        // Endpoint exists but wrong method
        web_server.Get("/api/v1/" + endpoint, [](const httplib::Request&, httplib::Response& res) {
            res.status = 405;
            res.set_content("{\"error\": {\"code\": \"invalid_request\", "
                            "\"message\": \"Method Not Allowed. Use POST for this endpoint\"}}",
                            "application/json");
        });
    };

    register_get("health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    register_get("models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });

    register_get("status", [this](const httplib::Request& req, httplib::Response& res) {
        handle_status(req, res);
    });

    register_get("system", [this](const httplib::Request& req, httplib::Response& res) {
        handle_system(req, res);
    });

    register_post("install", [this](const httplib::Request& req, httplib::Response& res) {
        handle_install(req, res);
    });

    register_post("launch", [this](const httplib::Request& req, httplib::Response& res) {
        handle_launch(req, res);
    });

    register_post("stop", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stop(req, res);
    });

    register_post("load", [this](const httplib::Request& req, httplib::Response& res) {
        handle_load(req, res);
    });

    register_post("generate", [this](const httplib::Request& req, httplib::Response& res) {
        handle_generate(req, res);
    });

    register_post("remove", [this](const httplib::Request& req, httplib::Response& res) {
        handle_remove(req, res);
    });

    register_post("shutdown", [this](const httplib::Request& req, httplib::Response& res) {
        handle_shutdown(req, res);
    });

    // Catch-all error handler - must be last!
    web_server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::cerr << "[Server] Error " << res.status << ": " << req.method << " " << req.path << std::endl;

        // Keep specific error bodies set by a handler
        if (res.status == 404 && res.body.empty()) {
            json error = {
                {"error", {
                    {"code", error_code_to_string(ErrorCode::NOT_FOUND)},
                    {"message", "The requested endpoint does not exist"},
                    {"path", req.path}
                }}
            };
            res.set_content(error.dump(), "application/json");
        }
    });
}

void Server::setup_http_logger(httplib::Server& web_server) {
    web_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        // Skip polling endpoints to reduce log noise
        if (req.path != "/api/v1/health" && req.path != "/api/v1/status") {
            std::cout << "[Server] " << req.method << " " << req.path << " - " << res.status << std::endl;
        }
    });
}

int Server::bind_to_any_port() {
    port_ = http_server_->bind_to_any_port(bind_host_);
    if (port_ < 0) {
        throw ProcessSpawnException("Failed to bind control server to " + bind_host_);
    }
    bound_ = true;
    return port_;
}

void Server::run() {
    if (!bound_) {
        if (!http_server_->bind_to_port(bind_host_, port_)) {
            throw ProcessSpawnException("Failed to bind control server to " + bind_host_ + ":" +
                                        std::to_string(port_));
        }
        bound_ = true;
    }

    std::cout << "[Server] Listening on http://" << bind_host_ << ":" << port_ << "/api/v1/" << std::endl;
    running_ = true;
    http_server_->listen_after_bind();
    running_ = false;
}

void Server::stop() {
    if (http_server_->is_running()) {
        std::cout << "[Server] Stopping HTTP server..." << std::endl;
        http_server_->stop();
    }
}

void Server::send_error(httplib::Response& res, const std::exception& e) {
    auto dock_error = dynamic_cast<const DockException*>(&e);
    res.status = dock_error ? ErrorResponse::http_status(dock_error->code()) : 500;
    res.set_content(ErrorResponse::from_exception(e).dump(), "application/json");
}

std::string Server::require_model(const json& request) {
    if (!request.contains("model") || !request["model"].is_string()) {
        throw InvalidRequestException("Request must include a \"model\" string");
    }
    return request["model"].get<std::string>();
}

void Server::stream_events(httplib::Response& res, std::function<void(EventChannel&)> producer) {
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        "text/event-stream",
        [producer](size_t offset, httplib::DataSink& sink) {
            if (offset > 0) {
                return false;  // Already sent everything
            }

            EventChannel channel;
            std::thread worker([&channel, &producer]() {
                try {
                    producer(channel);
                } catch (const std::exception& e) {
                    // The terminal event already carries the error when one went out
                    if (!channel.terminal_sent()) {
                        channel.push_error(ErrorResponse::from_exception(e));
                    }
                }
                channel.close();
            });

            Event event;
            while (channel.pop(event)) {
                std::string frame = event.to_sse();
                // sink.write() returns false when client disconnects
                if (!sink.write(frame.c_str(), frame.size())) {
                    std::cout << "[Server] Client disconnected, cancelling" << std::endl;
                    channel.cancel();
                    break;
                }
            }

            worker.join();
            sink.done();
            return true;
        });
}

void Server::handle_health(const httplib::Request&, httplib::Response& res) {
    json response = {
        {"status", "ok"},
        {"version", DOCK_VERSION_STRING}
    };
    res.set_content(response.dump(), "application/json");
}

void Server::handle_models(const httplib::Request&, httplib::Response& res) {
    try {
        json response = {{"models", host_.list_models()}};
        res.set_content(response.dump(), "application/json");
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void Server::handle_status(const httplib::Request&, httplib::Response& res) {
    try {
        res.set_content(host_.status().dump(), "application/json");
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void Server::handle_system(const httplib::Request&, httplib::Response& res) {
    try {
        json response = host_.system_specs();
        res.set_content(response.dump(), "application/json");
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void Server::handle_install(const httplib::Request& req, httplib::Response& res) {
    try {
        json request = utils::JsonUtils::parse_request(req.body);
        std::string model_id = require_model(request);
        bool stream = request.value("stream", true);

        if (stream) {
            stream_events(res, [this, model_id](EventChannel& channel) {
                host_.install(model_id, channel);
            });
            return;
        }

        // Blocking mode, the final event is returned as the body
        struct LastEventSink : public IEventSink {
            InstallProgress last;
            bool on_install_progress(const InstallProgress& progress) override {
                last = progress;
                return true;
            }
            bool on_chat_token(const ChatToken&) override { return true; }
            void on_chat_finished(const ChatFinished&) override {}
        } sink;

        host_.install(model_id, sink);
        res.set_content(json(sink.last).dump(), "application/json");
    } catch (const std::exception& e) {
        std::cerr << "[Server] ERROR in handle_install: " << e.what() << std::endl;
        send_error(res, e);
    }
}

void Server::handle_launch(const httplib::Request& req, httplib::Response& res) {
    try {
        json request = utils::JsonUtils::parse_request(req.body);
        std::string model_id = require_model(request);

        int port = host_.launch(model_id);
        json response = {
            {"status", "success"},
            {"model", model_id},
            {"port", port}
        };
        res.set_content(response.dump(), "application/json");
    } catch (const std::exception& e) {
        std::cerr << "[Server] ERROR in handle_launch: " << e.what() << std::endl;
        send_error(res, e);
    }
}

void Server::handle_stop(const httplib::Request&, httplib::Response& res) {
    try {
        host_.stop();
        res.set_content(json({{"status", "success"}}).dump(), "application/json");
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void Server::handle_load(const httplib::Request& req, httplib::Response& res) {
    try {
        json request = utils::JsonUtils::parse_request(req.body);
        std::string model_id = require_model(request);

        std::cout << "[Server] Loading model: " << model_id << std::endl;
        host_.load(model_id);

        json response = {
            {"status", "success"},
            {"model", model_id}
        };
        res.set_content(response.dump(), "application/json");
    } catch (const std::exception& e) {
        std::cerr << "[Server] ERROR in handle_load: " << e.what() << std::endl;
        send_error(res, e);
    }
}

void Server::handle_generate(const httplib::Request& req, httplib::Response& res) {
    try {
        json request = utils::JsonUtils::parse_request(req.body);
        if (!request.contains("prompt") || !request["prompt"].is_string()) {
            throw InvalidRequestException("Request must include a \"prompt\" string");
        }
        std::string prompt = request["prompt"].get<std::string>();
        int max_tokens = request.value("max_tokens", 0);

        stream_events(res, [this, prompt, max_tokens](EventChannel& channel) {
            host_.generate(prompt, channel, max_tokens);
        });
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void Server::handle_remove(const httplib::Request& req, httplib::Response& res) {
    try {
        json request = utils::JsonUtils::parse_request(req.body);
        std::string model_id = require_model(request);

        host_.remove(model_id);
        json response = {
            {"status", "success"},
            {"model", model_id}
        };
        res.set_content(response.dump(), "application/json");
    } catch (const std::exception& e) {
        std::cerr << "[Server] ERROR in handle_remove: " << e.what() << std::endl;
        send_error(res, e);
    }
}

void Server::handle_shutdown(const httplib::Request&, httplib::Response& res) {
    std::cout << "[Server] Shutdown request received" << std::endl;

    json response = {{"status", "shutting down"}};
    res.set_content(response.dump(), "application/json");

    if (shutdown_requested_.exchange(true)) {
        return;
    }

    // Stop asynchronously to allow the response to be sent
    shutdown_thread_ = std::thread([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop();
    });
}

} // namespace dock
