#include "dock/engine/llama_engine.h"
#include "dock/error_types.h"
#include <llama.h>
#include <climits>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace dock {
namespace engine {

static std::once_flag backend_init_flag;

static void ensure_backend_initialized() {
    std::call_once(backend_init_flag, [] {
        llama_backend_init();
    });
}

LlamaEngine::LlamaEngine(const std::string& model_path, int context_size) {
    if (!std::filesystem::exists(model_path)) {
        throw NotFoundException("Model file not found: " + model_path);
    }

    ensure_backend_initialized();

    std::cout << "[LlamaEngine] Loading " << model_path << std::endl;

    llama_model_params model_params = llama_model_default_params();
    model_ = llama_model_load_from_file(model_path.c_str(), model_params);
    if (!model_) {
        throw ModelLoadException("Failed to load model weights from " + model_path);
    }
    vocab_ = llama_model_get_vocab(model_);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(context_size);
    // The whole prompt is decoded as one batch
    ctx_params.n_batch = static_cast<uint32_t>(context_size);

    ctx_ = llama_init_from_model(model_, ctx_params);
    if (!ctx_) {
        llama_model_free(model_);
        model_ = nullptr;
        throw ModelLoadException("Failed to create a " + std::to_string(context_size) +
                                 "-token context for " + model_path);
    }

    sampler_ = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());

    std::cout << "[LlamaEngine] Context ready (" << llama_n_ctx(ctx_) << " tokens)" << std::endl;
}

LlamaEngine::~LlamaEngine() {
    if (sampler_) {
        llama_sampler_free(sampler_);
    }
    if (ctx_) {
        llama_free(ctx_);
    }
    if (model_) {
        llama_model_free(model_);
    }
}

std::vector<Token> LlamaEngine::tokenize(const std::string& text) {
    // A negative result is the required buffer size
    int32_t n_tokens = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                                      nullptr, 0, true, true);
    if (n_tokens == INT32_MIN) {
        throw TokenizationException("Prompt is too long to tokenize");
    }
    if (n_tokens < 0) {
        n_tokens = -n_tokens;
    }

    std::vector<Token> tokens(static_cast<size_t>(n_tokens));
    if (n_tokens > 0 &&
        llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, true, true) < 0) {
        throw TokenizationException("Failed to tokenize prompt");
    }
    return tokens;
}

void LlamaEngine::reset() {
    llama_memory_clear(llama_get_memory(ctx_), true);
    llama_sampler_reset(sampler_);
}

void LlamaEngine::decode(const std::vector<Token>& tokens, int start_pos) {
    if (tokens.empty()) {
        return;
    }

    const int32_t n_tokens = static_cast<int32_t>(tokens.size());
    llama_batch batch = llama_batch_init(n_tokens, 0, 1);
    for (int32_t i = 0; i < n_tokens; ++i) {
        batch.token[i] = tokens[i];
        batch.pos[i] = start_pos + i;
        batch.n_seq_id[i] = 1;
        batch.seq_id[i][0] = 0;
        batch.logits[i] = (i == n_tokens - 1);
    }
    batch.n_tokens = n_tokens;

    int32_t status = llama_decode(ctx_, batch);
    llama_batch_free(batch);

    if (status != 0) {
        throw DecodeException("llama_decode failed with status " + std::to_string(status) +
                              " at position " + std::to_string(start_pos));
    }
}

Token LlamaEngine::sample_greedy() {
    return llama_sampler_sample(sampler_, ctx_, -1);
}

bool LlamaEngine::is_end_of_sequence(Token token) const {
    return llama_vocab_is_eog(vocab_, token);
}

std::string LlamaEngine::token_to_text(Token token) const {
    char buf[256];
    int32_t n = llama_token_to_piece(vocab_, token, buf, sizeof(buf), 0, false);
    if (n >= 0) {
        return std::string(buf, static_cast<size_t>(n));
    }

    std::string piece(static_cast<size_t>(-n), '\0');
    n = llama_token_to_piece(vocab_, token, &piece[0], static_cast<int32_t>(piece.size()), 0, false);
    if (n < 0) {
        return "";
    }
    piece.resize(static_cast<size_t>(n));
    return piece;
}

int LlamaEngine::context_size() const {
    return static_cast<int>(llama_n_ctx(ctx_));
}

} // namespace engine
} // namespace dock
