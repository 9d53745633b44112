#pragma once

#include <string>
#include "text_engine.h"

struct llama_model;
struct llama_context;
struct llama_vocab;
struct llama_sampler;

namespace dock {
namespace engine {

// llama.cpp model + context with a greedy sampler chain
class LlamaEngine : public ITextEngine {
public:
    // Throws ModelLoadException if the weights or the context cannot be created
    LlamaEngine(const std::string& model_path, int context_size);
    ~LlamaEngine() override;

    LlamaEngine(const LlamaEngine&) = delete;
    LlamaEngine& operator=(const LlamaEngine&) = delete;

    std::vector<Token> tokenize(const std::string& text) override;
    void reset() override;
    void decode(const std::vector<Token>& tokens, int start_pos) override;
    Token sample_greedy() override;
    bool is_end_of_sequence(Token token) const override;
    std::string token_to_text(Token token) const override;
    int context_size() const override;

private:
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    const llama_vocab* vocab_ = nullptr;
    llama_sampler* sampler_ = nullptr;
};

} // namespace engine
} // namespace dock
