#include "dock/model_store.h"
#include "dock/error_types.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace dock {

std::string installation_state_to_string(InstallationState state) {
    switch (state) {
        case InstallationState::ABSENT:     return "absent";
        case InstallationState::INCOMPLETE: return "incomplete";
        case InstallationState::INSTALLED:  return "installed";
    }
    return "absent";
}

ModelStore::ModelStore(const std::string& data_dir)
    : data_dir_(data_dir) {}

std::string ModelStore::environment_dir() const {
    return (fs::path(data_dir_) / "venv").string();
}

std::string ModelStore::model_dir(const ModelDescriptor& model) const {
    return (fs::path(data_dir_) / "models" / model.id).string();
}

std::string ModelStore::weights_dir(const ModelDescriptor& model) const {
    return (fs::path(model_dir(model)) / "weights").string();
}

std::string ModelStore::weights_path(const ModelDescriptor& model) const {
    return (fs::path(weights_dir(model)) / model.source.filename).string();
}

std::string ModelStore::partial_path(const ModelDescriptor& model) const {
    return weights_path(model) + ".partial";
}

bool ModelStore::has_weights(const ModelDescriptor& model) const {
    std::error_code ec;
    return fs::is_regular_file(weights_path(model), ec);
}

std::string ModelStore::deps_marker_path(const ModelDescriptor& model) const {
    return (fs::path(model_dir(model)) / ".deps-ok").string();
}

bool ModelStore::has_deps_marker(const ModelDescriptor& model) const {
    std::error_code ec;
    return fs::is_regular_file(deps_marker_path(model), ec);
}

void ModelStore::mark_dependencies_installed(const ModelDescriptor& model) {
    std::string marker = deps_marker_path(model);
    std::error_code ec;
    fs::create_directories(model_dir(model), ec);
    if (ec) {
        throw StorageException("Failed to create " + model_dir(model) + ": " + ec.message());
    }

    std::ofstream out(marker, std::ios::trunc);
    out << "ok\n";
    if (!out) {
        throw StorageException("Failed to write " + marker);
    }
}

InstallationState ModelStore::installation_state(const ModelDescriptor& model) const {
    std::error_code ec;
    bool weights = has_weights(model);
    bool environment = fs::is_directory(environment_dir(), ec);

    if (weights && environment && has_deps_marker(model)) {
        return InstallationState::INSTALLED;
    }
    if (weights || fs::exists(partial_path(model), ec)) {
        return InstallationState::INCOMPLETE;
    }
    return InstallationState::ABSENT;
}

bool ModelStore::remove(const ModelDescriptor& model) {
    std::string dir = model_dir(model);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return false;
    }

    std::cout << "[ModelStore] Removing " << dir << std::endl;
    fs::remove_all(dir, ec);
    if (ec) {
        throw StorageException("Failed to remove " + dir + ": " + ec.message());
    }
    return true;
}

} // namespace dock
