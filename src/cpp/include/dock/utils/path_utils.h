#pragma once

#include <string>

namespace dock {
namespace utils {

// $XDG_DATA_HOME/modeldock, falling back to ~/.local/share/modeldock
// (~/Library/Application Support/modeldock on macOS)
std::string get_default_data_dir();

// Directory containing the running executable, empty if it cannot be determined
std::string get_executable_dir();

// Search $PATH for an executable file, empty if not found
std::string find_in_path(const std::string& name);

} // namespace utils
} // namespace dock
