#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../model_types.h"

namespace dock {
namespace engine {

using Token = int32_t;

// The capabilities the generation loop needs from an in-process model.
// One instance owns one loaded model plus its decoding context.
class ITextEngine {
public:
    virtual ~ITextEngine() = default;

    // Throws TokenizationException
    virtual std::vector<Token> tokenize(const std::string& text) = 0;

    // Clear the key/value cache so the next decode starts from position 0
    virtual void reset() = 0;

    // Evaluate tokens at positions [start_pos, start_pos + size). Logits of the
    // last token become available to sample_greedy(). Throws DecodeException.
    virtual void decode(const std::vector<Token>& tokens, int start_pos) = 0;

    // Arg-max over the current logits
    virtual Token sample_greedy() = 0;

    virtual bool is_end_of_sequence(Token token) const = 0;
    virtual std::string token_to_text(Token token) const = 0;
    virtual int context_size() const = 0;
};

using EngineFactoryFn = std::function<std::unique_ptr<ITextEngine>(
    const std::string& model_path, TaskType task_type, int context_size)>;

class EngineFactory {
public:
    // text-generation -> LlamaEngine. Anything else throws UnsupportedOperationException.
    static std::unique_ptr<ITextEngine> create(const std::string& model_path,
                                               TaskType task_type,
                                               int context_size);
};

} // namespace engine
} // namespace dock
