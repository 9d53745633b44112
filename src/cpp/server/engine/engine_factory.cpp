#include "dock/engine/text_engine.h"
#include "dock/engine/llama_engine.h"
#include "dock/error_types.h"

namespace dock {
namespace engine {

std::unique_ptr<ITextEngine> EngineFactory::create(const std::string& model_path,
                                                   TaskType task_type,
                                                   int context_size) {
    switch (task_type) {
        case TaskType::TEXT_GENERATION:
            return std::make_unique<LlamaEngine>(model_path, context_size);
        case TaskType::SPEECH_TO_TEXT:
            break;
    }
    throw UnsupportedOperationException("Embedded inference", task_type_to_string(task_type));
}

} // namespace engine
} // namespace dock
