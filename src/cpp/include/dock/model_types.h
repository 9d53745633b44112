#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dock {

using json = nlohmann::json;

enum class TaskType {
    TEXT_GENERATION,
    SPEECH_TO_TEXT
};

std::string task_type_to_string(TaskType type);

// Throws CatalogException for unknown names
TaskType task_type_from_string(const std::string& name);

// Advisory only, never enforced at runtime
struct ModelRequirements {
    uint64_t min_ram = 0;     // bytes
    uint64_t min_vram = 0;    // bytes
    uint64_t disk_space = 0;  // bytes
};

struct ModelSource {
    std::string url;
    std::string filename;
};

struct ModelDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    TaskType task_type = TaskType::TEXT_GENERATION;
    ModelRequirements requirements;
    ModelSource source;
    std::vector<std::string> dependencies;  // package identifiers, install order
};

void to_json(json& j, const ModelRequirements& r);
void from_json(const json& j, ModelRequirements& r);
void to_json(json& j, const ModelSource& s);
void from_json(const json& j, ModelSource& s);
void to_json(json& j, const ModelDescriptor& d);
void from_json(const json& j, ModelDescriptor& d);

} // namespace dock
