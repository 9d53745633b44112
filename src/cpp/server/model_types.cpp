#include "dock/model_types.h"
#include "dock/error_types.h"

namespace dock {

std::string task_type_to_string(TaskType type) {
    switch (type) {
        case TaskType::TEXT_GENERATION: return "text-generation";
        case TaskType::SPEECH_TO_TEXT:  return "speech-to-text";
    }
    return "unknown";
}

TaskType task_type_from_string(const std::string& name) {
    if (name == "text-generation") {
        return TaskType::TEXT_GENERATION;
    }
    if (name == "speech-to-text") {
        return TaskType::SPEECH_TO_TEXT;
    }
    throw CatalogException("Unknown task type: " + name);
}

void to_json(json& j, const ModelRequirements& r) {
    j = json{
        {"min_ram", r.min_ram},
        {"min_vram", r.min_vram},
        {"disk_space", r.disk_space}
    };
}

void from_json(const json& j, ModelRequirements& r) {
    r.min_ram = j.value("min_ram", static_cast<uint64_t>(0));
    r.min_vram = j.value("min_vram", static_cast<uint64_t>(0));
    r.disk_space = j.value("disk_space", static_cast<uint64_t>(0));
}

void to_json(json& j, const ModelSource& s) {
    j = json{{"url", s.url}, {"filename", s.filename}};
}

void from_json(const json& j, ModelSource& s) {
    j.at("url").get_to(s.url);
    j.at("filename").get_to(s.filename);
}

void to_json(json& j, const ModelDescriptor& d) {
    j = json{
        {"id", d.id},
        {"name", d.name},
        {"description", d.description},
        {"version", d.version},
        {"task_type", task_type_to_string(d.task_type)},
        {"requirements", d.requirements},
        {"source", d.source},
        {"dependencies", d.dependencies}
    };
}

void from_json(const json& j, ModelDescriptor& d) {
    j.at("id").get_to(d.id);
    d.name = j.value("name", d.id);
    d.description = j.value("description", "");
    d.version = j.value("version", "");
    d.task_type = task_type_from_string(j.value("task_type", "text-generation"));
    if (j.contains("requirements")) {
        j.at("requirements").get_to(d.requirements);
    }
    j.at("source").get_to(d.source);
    d.dependencies = j.value("dependencies", std::vector<std::string>{});
}

} // namespace dock
