#pragma once

#include <string>
#include "model_types.h"

namespace dock {

// What the filesystem says about a model. Never persisted, always re-derived.
enum class InstallationState {
    ABSENT,      // nothing on disk
    INCOMPLETE,  // interrupted download, or dependencies never finished installing
    INSTALLED
};

std::string installation_state_to_string(InstallationState state);

// On-disk layout under the application data directory:
//   <data_dir>/models/<id>/weights/<filename>
//   <data_dir>/models/<id>/.deps-ok              written once the model's packages are in
//   <data_dir>/venv/                           shared dependency environment
class ModelStore {
public:
    explicit ModelStore(const std::string& data_dir);

    const std::string& data_dir() const { return data_dir_; }
    std::string environment_dir() const;

    std::string model_dir(const ModelDescriptor& model) const;
    std::string weights_dir(const ModelDescriptor& model) const;
    std::string weights_path(const ModelDescriptor& model) const;

    // Download target while the body is still arriving
    std::string partial_path(const ModelDescriptor& model) const;

    bool has_weights(const ModelDescriptor& model) const;

    std::string deps_marker_path(const ModelDescriptor& model) const;
    bool has_deps_marker(const ModelDescriptor& model) const;
    // Throws StorageException if the marker cannot be written
    void mark_dependencies_installed(const ModelDescriptor& model);

    // INSTALLED needs the weights, the shared environment and the deps marker
    InstallationState installation_state(const ModelDescriptor& model) const;
    bool is_installed(const ModelDescriptor& model) const {
        return installation_state(model) == InstallationState::INSTALLED;
    }

    // Delete models/<id>; returns false if nothing was there
    bool remove(const ModelDescriptor& model);

private:
    std::string data_dir_;
};

} // namespace dock
