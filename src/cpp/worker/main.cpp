// dock-worker: serves one text-generation model over HTTP for ProcessSupervisor.
//
//   dock-worker --model <path> --port <port> [--host 127.0.0.1]
//
//   GET  /health  200 once the model is loaded
//   POST /chat    {"message": "...", "max_tokens": 200} -> {"reply": "..."}

#ifndef CPPHTTPLIB_THREAD_POOL_COUNT
#define CPPHTTPLIB_THREAD_POOL_COUNT 4
#endif

#include <CLI/CLI.hpp>
#include <httplib.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <dock/error_types.h>
#include <dock/inference_session.h>
#include <dock/utils/json_utils.h>
#include <dock/version.h>

using namespace dock;

static httplib::Server* g_server = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_server) {
        g_server->stop();
    }
}

// The reply goes back in one piece, tokens are only counted
class SilentSink : public IEventSink {
public:
    bool on_install_progress(const InstallProgress&) override { return true; }
    bool on_chat_token(const ChatToken&) override { return true; }
    void on_chat_finished(const ChatFinished&) override {}
};

int main(int argc, char** argv) {
    std::string model_path;
    std::string host = "127.0.0.1";
    int port = 0;
    int max_tokens = 200;

    CLI::App app("dock-worker - ModelDock text-generation backend");
    app.set_version_flag("-v,--version", "dock-worker version " DOCK_VERSION_STRING);
    app.add_option("--model", model_path, "Path to the GGUF weights")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--port", port, "Port to listen on")
        ->required()
        ->check(CLI::Range(1, 65535));
    app.add_option("--host", host, "Address to bind")
        ->default_val(host);
    app.add_option("--max-tokens", max_tokens, "Default reply length limit")
        ->check(CLI::Range(1, 200))
        ->default_val(max_tokens);

    CLI11_PARSE(app, argc, argv);

    try {
        SessionOptions options;
        options.max_tokens = max_tokens;
        InferenceSession session(options);
        session.load_model(model_path, TaskType::TEXT_GENERATION);

        httplib::Server server;
        server.new_task_queue = [] {
            return new httplib::ThreadPool(CPPHTTPLIB_THREAD_POOL_COUNT);
        };

        server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(json({{"status", "ok"}}).dump(), "application/json");
        });

        server.Post("/chat", [&session](const httplib::Request& req, httplib::Response& res) {
            try {
                json request = utils::JsonUtils::parse_request(req.body);
                if (!request.contains("message") || !request["message"].is_string()) {
                    throw InvalidRequestException("Request must include a \"message\" string");
                }
                int limit = request.value("max_tokens", 0);

                SilentSink sink;
                GenerationResult result = session.generate(request["message"].get<std::string>(), sink, limit);
                result.rethrow_if_error();

                json response = {
                    {"reply", result.text},
                    {"finish_reason", finish_reason_to_string(result.reason)},
                    {"tokens", result.tokens}
                };
                res.set_content(response.dump(), "application/json");
            } catch (const DockException& e) {
                std::cerr << "[Worker] /chat failed: " << e.what() << std::endl;
                res.status = ErrorResponse::http_status(e.code());
                res.set_content(ErrorResponse::from_exception(e).dump(), "application/json");
            } catch (const std::exception& e) {
                std::cerr << "[Worker] /chat failed: " << e.what() << std::endl;
                res.status = 500;
                res.set_content(ErrorResponse::from_exception(e).dump(), "application/json");
            }
        });

        g_server = &server;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << "[Worker] Serving " << model_path << " on " << host << ":" << port << std::endl;
        if (!server.listen(host, port)) {
            std::cerr << "[Worker] Failed to listen on " << host << ":" << port << std::endl;
            g_server = nullptr;
            return 1;
        }
        g_server = nullptr;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Error: " << e.what() << std::endl;
        return 1;
    }
}
