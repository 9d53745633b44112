#pragma once

#include <string>
#include "../model_types.h"

namespace dock {
namespace backends {

// Describes an executable that serves one kind of model behind
// `--model <path> --port <port>` and `GET /health`.
struct BackendSpec {
    BackendSpec(const std::string& recipe, const std::string& binary)
        : recipe(recipe), binary(binary) {}

    std::string recipe;
    std::string binary;

    std::string log_name() const { return recipe; }
};

class BackendUtils {
public:
    // text-generation -> dock-worker, speech-to-text -> whisper-server
    static const BackendSpec& spec_for(TaskType task_type);

    // $DOCK_<RECIPE>_BIN if set and present on disk, empty otherwise
    static std::string find_external_backend_binary(const std::string& recipe);

    // Environment override, then next to the running executable, then $PATH.
    // Throws ProcessSpawnException if the binary cannot be found.
    static std::string get_backend_binary_path(const BackendSpec& spec);
};

} // namespace backends
} // namespace dock
