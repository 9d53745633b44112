#include "dock/backends/backend_utils.h"
#include "dock/error_types.h"
#include "dock/utils/path_utils.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace dock {
namespace backends {

static const BackendSpec WORKER_SPEC("worker", "dock-worker");
static const BackendSpec WHISPER_SPEC("whispercpp", "whisper-server");

const BackendSpec& BackendUtils::spec_for(TaskType task_type) {
    switch (task_type) {
        case TaskType::TEXT_GENERATION:
            return WORKER_SPEC;
        case TaskType::SPEECH_TO_TEXT:
            return WHISPER_SPEC;
    }
    throw UnsupportedOperationException("Launching a service", task_type_to_string(task_type));
}

static std::string override_env_name(const std::string& recipe) {
    std::string upper = recipe;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    // '-' is not valid in environment variable names
    upper.erase(std::remove(upper.begin(), upper.end(), '-'), upper.end());
    return "DOCK_" + upper + "_BIN";
}

std::string BackendUtils::find_external_backend_binary(const std::string& recipe) {
    std::string env = override_env_name(recipe);
    const char* backend_bin_env = std::getenv(env.c_str());
    if (!backend_bin_env) {
        return "";
    }

    std::string backend_bin(backend_bin_env);
    if (!fs::exists(backend_bin)) {
        std::cerr << "[BackendUtils] " << env << " points to a missing file: " << backend_bin << std::endl;
        return "";
    }
    return backend_bin;
}

std::string BackendUtils::get_backend_binary_path(const BackendSpec& spec) {
    std::string exe_path = find_external_backend_binary(spec.recipe);
    if (!exe_path.empty()) {
        return exe_path;
    }

    std::string exe_dir = utils::get_executable_dir();
    if (!exe_dir.empty()) {
        fs::path sibling = fs::path(exe_dir) / spec.binary;
        if (fs::exists(sibling)) {
            return sibling.string();
        }
    }

    exe_path = utils::find_in_path(spec.binary);
    if (!exe_path.empty()) {
        return exe_path;
    }

    throw ProcessSpawnException(spec.binary + " not found. Install it next to modeldock, add it to PATH, "
                                "or set " + override_env_name(spec.recipe));
}

} // namespace backends
} // namespace dock
