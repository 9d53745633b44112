#include "dock/utils/path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <sstream>

#ifdef __APPLE__
    #include <mach-o/dyld.h>
    #include <limits.h>
#endif
#include <unistd.h>

namespace fs = std::filesystem;

namespace dock {
namespace utils {

std::string get_default_data_dir() {
#ifdef __APPLE__
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / "Library" / "Application Support" / "modeldock").string();
    }
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data && xdg_data[0] != '\0') {
        return (fs::path(xdg_data) / "modeldock").string();
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / ".local" / "share" / "modeldock").string();
    }
#endif
    return (fs::temp_directory_path() / "modeldock").string();
}

std::string get_executable_dir() {
#ifdef __APPLE__
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        return fs::canonical(buffer).parent_path().string();
    }
    return "";
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "";
    }
    return exe.parent_path().string();
#endif
}

std::string find_in_path(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return "";
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

} // namespace utils
} // namespace dock
