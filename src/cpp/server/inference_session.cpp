#include "dock/inference_session.h"
#include "dock/error_types.h"
#include <algorithm>
#include <iostream>

namespace dock {

InferenceSession::InferenceSession(SessionOptions options, engine::EngineFactoryFn factory)
    : options_(options), factory_(std::move(factory)) {}

InferenceSession::~InferenceSession() = default;

std::unique_lock<std::timed_mutex> InferenceSession::acquire() {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (options_.lock_timeout.count() <= 0) {
        lock.lock();
    } else if (!lock.try_lock_for(options_.lock_timeout)) {
        throw LockAcquisitionException("the inference engine");
    }
    return lock;
}

void InferenceSession::load_model(const std::string& model_path, TaskType task_type) {
    auto lock = acquire();

    // Release first so two models never sit in memory together
    engine_.reset();
    model_path_.clear();

    std::cout << "[InferenceSession] Loading " << model_path << " ("
              << task_type_to_string(task_type) << ")" << std::endl;

    engine_ = factory_(model_path, task_type, options_.context_size);
    model_path_ = model_path;

    std::cout << "[InferenceSession] Model loaded" << std::endl;
}

void InferenceSession::load_model(const ModelDescriptor& model, const ModelStore& store) {
    if (!store.has_weights(model)) {
        throw NotFoundException("Model " + model.id + " is not installed");
    }
    load_model(store.weights_path(model), model.task_type);
}

void InferenceSession::unload() {
    auto lock = acquire();
    engine_.reset();
    model_path_.clear();
}

bool InferenceSession::is_loaded() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return engine_ != nullptr;
}

std::string InferenceSession::loaded_model_path() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return model_path_;
}

GenerationResult InferenceSession::generate(const std::string& prompt, IEventSink& sink, int max_tokens) {
    GenerationResult result;
    // The configured limit is a ceiling; callers may only ask for less
    max_tokens = max_tokens <= 0 ? options_.max_tokens : std::min(max_tokens, options_.max_tokens);

    ChatFinished finished;
    std::unique_lock<std::timed_mutex> lock;
    try {
        lock = acquire();
        run_generation(prompt, sink, max_tokens, result);
    } catch (const std::exception& e) {
        std::cerr << "[InferenceSession] Generation failed: " << e.what() << std::endl;
        result.reason = FinishReason::ERROR;
        result.error = std::current_exception();
        json error = ErrorResponse::from_exception(e);
        finished.error_code = error["error"]["code"].get<std::string>();
        finished.error_message = error["error"]["message"].get<std::string>();
    }

    // Still under the lock, so the next generation's events start after this one
    finished.reason = result.reason;
    finished.tokens = result.tokens;
    sink.on_chat_finished(finished);

    return result;
}

void InferenceSession::run_generation(const std::string& prompt, IEventSink& sink, int max_tokens,
                                      GenerationResult& result) {
    if (!engine_) {
        throw ModelNotLoadedException();
    }

    std::vector<engine::Token> prompt_tokens = engine_->tokenize(prompt);
    if (prompt_tokens.empty()) {
        throw TokenizationException("Prompt produced no tokens");
    }

    const int n_ctx = engine_->context_size();
    int cursor = static_cast<int>(prompt_tokens.size());
    if (cursor >= n_ctx) {
        throw TokenizationException("Prompt is " + std::to_string(cursor) +
                                    " tokens, the context window holds " + std::to_string(n_ctx));
    }

    engine_->reset();
    engine_->decode(prompt_tokens, 0);

    const int limit = std::min(max_tokens, n_ctx - cursor);

    while (result.tokens < limit) {
        engine::Token next = engine_->sample_greedy();
        if (engine_->is_end_of_sequence(next)) {
            result.reason = FinishReason::END_OF_SEQUENCE;
            return;
        }

        ChatToken event;
        event.token = engine_->token_to_text(next);
        result.text += event.token;
        result.tokens++;

        if (!sink.on_chat_token(event)) {
            result.reason = FinishReason::CANCELLED;
            return;
        }

        if (result.tokens == limit) {
            break;
        }

        engine_->decode({next}, cursor);
        cursor++;
    }

    result.reason = FinishReason::MAX_TOKENS;
}

} // namespace dock
