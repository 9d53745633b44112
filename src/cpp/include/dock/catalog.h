#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model_types.h"

namespace dock {

using json = nlohmann::json;

// Immutable list of installable models. Validated on construction:
// ids are unique and every source filename is a plain file name.
class Catalog {
public:
    explicit Catalog(std::vector<ModelDescriptor> models);

    // The models shipped with ModelDock
    static Catalog builtin();

    // {"models": [ ... ]} or a bare array of descriptors
    static Catalog from_json(const json& catalog_json);
    static Catalog load_from_file(const std::string& path);

    const std::vector<ModelDescriptor>& models() const { return models_; }

    bool contains(const std::string& model_id) const;

    // Throws NotFoundException for unknown ids
    const ModelDescriptor& get(const std::string& model_id) const;

    static bool is_safe_filename(const std::string& filename);

private:
    std::vector<ModelDescriptor> models_;
};

} // namespace dock
