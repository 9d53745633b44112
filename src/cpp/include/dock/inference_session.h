#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include "engine/text_engine.h"
#include "events.h"
#include "model_store.h"
#include "model_types.h"

namespace dock {

struct SessionOptions {
    int context_size = 2048;
    int max_tokens = 200;
    std::chrono::milliseconds lock_timeout{0};  // 0 = wait forever
};

struct GenerationResult {
    FinishReason reason = FinishReason::END_OF_SEQUENCE;
    int tokens = 0;
    std::string text;
    std::exception_ptr error;  // set when reason == ERROR

    bool ok() const { return !error; }

    void rethrow_if_error() const {
        if (error) {
            std::rethrow_exception(error);
        }
    }
};

// The embedded engine context. Loading and generating take the same lock, so a
// generation runs start to finish before another one (or a reload) begins.
class InferenceSession {
public:
    explicit InferenceSession(SessionOptions options = SessionOptions(),
                              engine::EngineFactoryFn factory = engine::EngineFactory::create);
    ~InferenceSession();

    InferenceSession(const InferenceSession&) = delete;
    InferenceSession& operator=(const InferenceSession&) = delete;

    // Replaces the current engine. On failure no model is loaded.
    void load_model(const std::string& model_path, TaskType task_type);
    void load_model(const ModelDescriptor& model, const ModelStore& store);

    void unload();

    bool is_loaded();
    std::string loaded_model_path();

    // Streams chat-token events and always finishes with one chat-finished
    // event. Failures are reported through GenerationResult::error rather than
    // thrown. max_tokens <= 0 uses the configured limit.
    GenerationResult generate(const std::string& prompt, IEventSink& sink, int max_tokens = 0);

private:
    std::unique_lock<std::timed_mutex> acquire();
    void run_generation(const std::string& prompt, IEventSink& sink, int max_tokens,
                        GenerationResult& result);

    SessionOptions options_;
    engine::EngineFactoryFn factory_;

    std::timed_mutex mutex_;
    std::unique_ptr<engine::ITextEngine> engine_;
    std::string model_path_;
};

} // namespace dock
