#include "dock/catalog.h"
#include "dock/error_types.h"
#include "dock/utils/json_utils.h"
#include <iostream>
#include <set>

namespace dock {

static constexpr uint64_t GB = 1024ULL * 1024ULL * 1024ULL;
static constexpr uint64_t MB = 1024ULL * 1024ULL;

Catalog::Catalog(std::vector<ModelDescriptor> models)
    : models_(std::move(models)) {
    std::set<std::string> seen;
    for (const auto& model : models_) {
        if (model.id.empty()) {
            throw CatalogException("Catalog entry with empty id");
        }
        if (!seen.insert(model.id).second) {
            throw CatalogException("Duplicate model id in catalog: " + model.id);
        }
        if (!is_safe_filename(model.source.filename)) {
            throw CatalogException("Model " + model.id + " has an unsafe source filename: '" +
                                   model.source.filename + "'");
        }
        if (model.source.url.empty()) {
            throw CatalogException("Model " + model.id + " has no source url");
        }
    }
}

bool Catalog::is_safe_filename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
        return false;
    }
    if (filename.find("..") != std::string::npos) {
        return false;
    }
    return filename.find('\0') == std::string::npos;
}

bool Catalog::contains(const std::string& model_id) const {
    for (const auto& model : models_) {
        if (model.id == model_id) {
            return true;
        }
    }
    return false;
}

const ModelDescriptor& Catalog::get(const std::string& model_id) const {
    for (const auto& model : models_) {
        if (model.id == model_id) {
            return model;
        }
    }
    throw NotFoundException("Model not found: " + model_id);
}

Catalog Catalog::from_json(const json& catalog_json) {
    const json& entries = catalog_json.is_object() ? catalog_json.value("models", json::array())
                                                   : catalog_json;
    if (!entries.is_array()) {
        throw CatalogException("Catalog must be an array of models or an object with a 'models' array");
    }

    std::vector<ModelDescriptor> models;
    for (const auto& entry : entries) {
        try {
            models.push_back(entry.get<ModelDescriptor>());
        } catch (const json::exception& e) {
            throw CatalogException(std::string("Invalid catalog entry: ") + e.what());
        }
    }
    return Catalog(std::move(models));
}

Catalog Catalog::load_from_file(const std::string& path) {
    std::cout << "[Catalog] Loading models from " << path << std::endl;
    try {
        return from_json(utils::JsonUtils::load_from_file(path));
    } catch (const CatalogException&) {
        throw;
    } catch (const std::exception& e) {
        throw CatalogException(e.what());
    }
}

Catalog Catalog::builtin() {
    std::vector<ModelDescriptor> models;

    ModelDescriptor qwen;
    qwen.id = "qwen2.5-1.5b-instruct";
    qwen.name = "Qwen2.5 1.5B Instruct";
    qwen.description = "Lightweight instruction-tuned model with strong multilingual support "
                       "and reasoning. Runs on laptops with 4 GB of RAM.";
    qwen.version = "Q4_K_M";
    qwen.task_type = TaskType::TEXT_GENERATION;
    qwen.requirements = {4 * GB, 2 * GB, 1 * GB};
    qwen.source.url = "https://huggingface.co/Qwen/Qwen2.5-1.5B-Instruct-GGUF/resolve/main/"
                      "qwen2.5-1.5b-instruct-q4_k_m.gguf";
    qwen.source.filename = "qwen2.5-1.5b-instruct-q4_k_m.gguf";
    qwen.dependencies = {"llama-cpp-python", "uvicorn", "fastapi"};
    models.push_back(qwen);

    ModelDescriptor gemma;
    gemma.id = "gemma-2-2b-it";
    gemma.name = "Google Gemma 2 2B";
    gemma.description = "Small open model with solid logical reasoning and summarization.";
    gemma.version = "Q4_K_M";
    gemma.task_type = TaskType::TEXT_GENERATION;
    gemma.requirements = {4 * GB, 2 * GB, 2 * GB};
    gemma.source.url = "https://huggingface.co/bartowski/gemma-2-2b-it-GGUF/resolve/main/"
                       "gemma-2-2b-it-Q4_K_M.gguf";
    gemma.source.filename = "gemma-2-2b-it-Q4_K_M.gguf";
    gemma.dependencies = {"llama-cpp-python", "uvicorn", "fastapi"};
    models.push_back(gemma);

    ModelDescriptor whisper;
    whisper.id = "whisper-tiny";
    whisper.name = "Whisper Tiny";
    whisper.description = "Lightweight speech recognition model for fast voice-to-text.";
    whisper.version = "tiny";
    whisper.task_type = TaskType::SPEECH_TO_TEXT;
    whisper.requirements = {1 * GB, 0, 100 * MB};
    whisper.source.url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/master/ggml-tiny.bin";
    whisper.source.filename = "ggml-tiny.bin";
    whisper.dependencies = {"openai-whisper", "soundfile"};
    models.push_back(whisper);

    return Catalog(std::move(models));
}

} // namespace dock
