#include "dock/dependency_environment.h"
#include "dock/error_types.h"
#include "dock/utils/process_manager.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace dock {

// Keep the tail of the package manager output, that is where the error is
static const size_t MAX_CAPTURED_OUTPUT = 4000;

static void append_line(std::string& captured, const std::string& line) {
    captured += line;
    captured += '\n';
    if (captured.size() > MAX_CAPTURED_OUTPUT) {
        captured.erase(0, captured.size() - MAX_CAPTURED_OUTPUT);
    }
}

DependencyEnvironment::DependencyEnvironment(const std::string& directory, const std::string& python)
    : directory_(directory), python_(python) {}

std::string DependencyEnvironment::python_path() const {
    return (fs::path(directory_) / "bin" / "python3").string();
}

std::string DependencyEnvironment::pip_path() const {
    return (fs::path(directory_) / "bin" / "pip3").string();
}

bool DependencyEnvironment::exists() const {
    std::error_code ec;
    return fs::is_directory(directory_, ec);
}

bool DependencyEnvironment::ensure_created() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (exists()) {
        return false;
    }

    std::cout << "[DependencyEnvironment] Creating virtual environment at " << directory_ << std::endl;

    std::error_code ec;
    fs::create_directories(fs::path(directory_).parent_path(), ec);

    std::string captured;
    int exit_code;
    try {
        exit_code = utils::ProcessManager::run_process_with_output(
            python_, {"-m", "venv", directory_},
            [&captured](const std::string& line) {
                append_line(captured, line);
                return true;
            });
    } catch (const ProcessSpawnException& e) {
        fs::remove_all(directory_, ec);
        throw DependencyInstallException("Failed to create dependency environment", e.what());
    }

    if (exit_code != 0) {
        std::cerr << "[DependencyEnvironment] venv creation failed with exit code "
                  << exit_code << std::endl;
        fs::remove_all(directory_, ec);
        throw DependencyInstallException("Failed to create dependency environment", captured);
    }

    std::cout << "[DependencyEnvironment] Virtual environment ready" << std::endl;
    return true;
}

void DependencyEnvironment::install_packages(const std::vector<std::string>& packages) {
    if (packages.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string pip = pip_path();
    std::error_code ec;
    if (!fs::exists(pip, ec)) {
        throw DependencyInstallException("pip not found at " + pip +
                                         ", the dependency environment may be damaged");
    }

    std::vector<std::string> args = {"install"};
    args.insert(args.end(), packages.begin(), packages.end());

    std::cout << "[DependencyEnvironment] Running: " << pip;
    for (const auto& arg : args) {
        std::cout << " " << arg;
    }
    std::cout << std::endl;

    std::string captured;
    int exit_code;
    try {
        exit_code = utils::ProcessManager::run_process_with_output(
            pip, args,
            [&captured](const std::string& line) {
                append_line(captured, line);
                return true;
            });
    } catch (const ProcessSpawnException& e) {
        throw DependencyInstallException("Failed to run package manager", e.what());
    }

    if (exit_code != 0) {
        std::cerr << "[DependencyEnvironment] pip exited with code " << exit_code << std::endl;
        throw DependencyInstallException("Package install failed (exit code " +
                                         std::to_string(exit_code) + ")", captured);
    }
}

} // namespace dock
