#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "catalog.h"
#include "dependency_environment.h"
#include "events.h"
#include "inference_session.h"
#include "install_pipeline.h"
#include "model_store.h"
#include "process_supervisor.h"
#include "system_info.h"
#include "utils/http_client.h"

namespace dock {

using json = nlohmann::json;

struct HostOptions {
    std::string data_dir;
    std::string catalog_path;  // empty = built-in catalog
    std::string python = "python3";
    std::string log_level = "info";
    SupervisorOptions supervisor;
    SessionOptions session;
    utils::DownloadOptions download;
    std::shared_ptr<SystemInfo> system_info;  // null = detect this machine
};

// The command context the CLI and the control server drive. Owns every piece
// of mutable application state; nothing lives in globals.
class Host {
public:
    explicit Host(const HostOptions& options,
                  engine::EngineFactoryFn engine_factory = engine::EngineFactory::create);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    const Catalog& catalog() const { return *catalog_; }
    ModelStore& store() { return *store_; }
    ProcessSupervisor& supervisor() { return *supervisor_; }
    InferenceSession& session() { return *session_; }

    // Catalog entries with their installation state and an advisory
    // `compatible` / `reason` pair against this machine's specs
    json list_models();

    // Read once, on first use
    const SystemSpecs& system_specs();

    // Unknown ids still produce an `error` install-progress event before throwing
    void install(const std::string& model_id, IEventSink& sink);

    int launch(const std::string& model_id);
    void load(const std::string& model_id);

    // chat-finished is emitted before any generation error is rethrown
    GenerationResult generate(const std::string& prompt, IEventSink& sink, int max_tokens = 0);

    void stop();

    // The loaded model's id is derived from the session's weights path, so it
    // can never disagree with what the session actually holds
    json status();

    // Refuses to remove the model that is currently running or loaded
    void remove(const std::string& model_id);

private:
    std::string log_level_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<ModelStore> store_;
    std::unique_ptr<DependencyEnvironment> environment_;
    std::unique_ptr<InstallPipeline> pipeline_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
    std::unique_ptr<InferenceSession> session_;

    std::shared_ptr<SystemInfo> system_info_;
    std::once_flag specs_once_;
    SystemSpecs specs_;
};

} // namespace dock
