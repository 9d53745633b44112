#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace dock {

// Python virtual environment shared by every installed model.
// Created once per data directory and reused afterwards.
class DependencyEnvironment {
public:
    DependencyEnvironment(const std::string& directory, const std::string& python = "python3");

    const std::string& directory() const { return directory_; }
    std::string python_path() const;
    std::string pip_path() const;

    bool exists() const;

    // `<python> -m venv <directory>` unless the directory is already there.
    // Returns true if the environment was created by this call.
    // Throws DependencyInstallException; a failed attempt leaves nothing behind.
    bool ensure_created();

    // `<pip> install <packages...>`; empty list is a no-op.
    // Throws DependencyInstallException carrying the captured output on non-zero exit.
    void install_packages(const std::vector<std::string>& packages);

private:
    std::string directory_;
    std::string python_;
    std::mutex mutex_;  // one package manager run at a time
};

} // namespace dock
