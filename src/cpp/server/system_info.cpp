#include "dock/system_info.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace dock {

static constexpr uint64_t BYTES_PER_KB = 1024;
static constexpr uint64_t BYTES_PER_MB = 1024 * 1024;
static constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    return s.substr(start, end - start + 1);
}

static std::string run_command(const char* command) {
    FILE* pipe = popen(command, "r");
    if (!pipe) {
        return "";
    }

    char buffer[256];
    std::string output;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    pclose(pipe);
    return output;
}

static std::string format_gigabytes(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (bytes / BYTES_PER_GB) << " GB";
    return oss.str();
}

uint64_t SystemSpecs::total_vram() const {
    uint64_t total = 0;
    for (const auto& gpu : gpus) {
        total += gpu.vram_total;
    }
    return total;
}

void to_json(json& j, const GPUInfo& gpu) {
    j = json{
        {"name", gpu.name},
        {"vram_total", gpu.vram_total},
        {"vram_used", gpu.vram_used},
        {"driver_version", gpu.driver_version}
    };
}

void to_json(json& j, const SystemSpecs& specs) {
    j = json{
        {"os_name", specs.os_name},
        {"os_version", specs.os_version},
        {"cpu_model", specs.cpu_model},
        {"cpu_cores", specs.cpu_cores},
        {"total_memory", specs.total_memory},
        {"used_memory", specs.used_memory},
        {"gpus", specs.gpus}
    };
}

Compatibility check_compatibility(const ModelRequirements& requirements, const SystemSpecs& specs) {
    Compatibility result;

    if (specs.total_memory > 0 && specs.total_memory < requirements.min_ram) {
        result.compatible = false;
        result.reason = "Insufficient RAM (needs " + format_gigabytes(requirements.min_ram) + ")";
        return result;
    }

    uint64_t vram = specs.total_vram();
    if (requirements.min_vram > 0 && vram > 0 && vram < requirements.min_vram) {
        result.compatible = false;
        result.reason = "Insufficient VRAM (needs " + format_gigabytes(requirements.min_vram) + ")";
    }
    return result;
}

// ============================================================================
// Linux implementation
// ============================================================================

SystemSpecs LinuxSystemInfo::get_specs() {
    SystemSpecs specs;
    specs.os_name = "Linux";
    specs.os_version = get_os_version();

    std::ifstream cpuinfo("/proc/cpuinfo");
    if (cpuinfo.is_open()) {
        parse_cpuinfo(cpuinfo, specs.cpu_model, specs.cpu_cores);
    }
    if (specs.cpu_model.empty()) {
        specs.cpu_model = get_processor_name();
    }

    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo.is_open() || !parse_meminfo(meminfo, specs.total_memory, specs.used_memory)) {
        std::cerr << "[SystemInfo] Could not read total memory from /proc/meminfo" << std::endl;
    }

    specs.gpus = get_nvidia_gpus();
    return specs;
}

std::string LinuxSystemInfo::get_os_version() {
    std::string kernel = "unknown_kernel";

    std::ifstream file("/proc/version");
    if (file.is_open()) {
        std::string line;
        std::getline(file, line);

        const std::string tag = "version ";
        size_t pos = line.find(tag);
        if (pos != std::string::npos) {
            pos += tag.size();
            size_t end = line.find(' ', pos);
            kernel = line.substr(pos, end - pos);
        }
    }
    std::string result = kernel;

    std::ifstream os_release("/etc/os-release");
    if (os_release.is_open()) {
        std::string line;
        std::string distro_name, distro_version;
        while (std::getline(os_release, line)) {
            if (line.find("NAME=") == 0) {
                distro_name = line.substr(5);
                distro_name.erase(std::remove(distro_name.begin(), distro_name.end(), '"'), distro_name.end());
            } else if (line.find("VERSION_ID=") == 0) {
                distro_version = line.substr(11);
                distro_version.erase(std::remove(distro_version.begin(), distro_version.end(), '"'),
                                     distro_version.end());
            }
        }

        if (!distro_name.empty()) {
            result += " (" + distro_name;
            if (!distro_version.empty()) {
                result += " " + distro_version;
            }
            result += ")";
        }
    }

    return result;
}

// Fallback for kernels whose /proc/cpuinfo has no "model name" (most ARM boards)
std::string LinuxSystemInfo::get_processor_name() {
    std::istringstream iss(run_command("lscpu 2>/dev/null"));
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("Model name:") != std::string::npos) {
            return trim(line.substr(line.find(':') + 1));
        }
    }
    return "";
}

std::vector<GPUInfo> LinuxSystemInfo::get_nvidia_gpus() {
    return parse_nvidia_smi(run_command(
        "nvidia-smi --query-gpu=name,memory.total,memory.used,driver_version "
        "--format=csv,noheader,nounits 2>/dev/null"));
}

bool LinuxSystemInfo::parse_meminfo(std::istream& in, uint64_t& total, uint64_t& used) {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    bool have_available = false;

    std::string token;
    while (in >> token) {
        if (token == "MemTotal:") {
            in >> total_kb;
        } else if (token == "MemAvailable:") {
            have_available = static_cast<bool>(in >> available_kb);
        }
        in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    if (total_kb == 0) {
        return false;
    }
    total = total_kb * BYTES_PER_KB;
    used = have_available && available_kb <= total_kb ? (total_kb - available_kb) * BYTES_PER_KB : 0;
    return true;
}

void LinuxSystemInfo::parse_cpuinfo(std::istream& in, std::string& model, int& cores) {
    std::string line;
    int processors = 0;
    while (std::getline(in, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, colon));
        if (key == "processor") {
            processors++;
        } else if (key == "model name" && model.empty()) {
            model = trim(line.substr(colon + 1));
        }
    }
    cores = processors;
}

std::vector<GPUInfo> LinuxSystemInfo::parse_nvidia_smi(const std::string& csv) {
    std::vector<GPUInfo> gpus;
    std::istringstream lines(csv);
    std::string line;
    while (std::getline(lines, line)) {
        std::vector<std::string> fields;
        std::istringstream cells(line);
        std::string cell;
        while (std::getline(cells, cell, ',')) {
            fields.push_back(trim(cell));
        }
        if (fields.size() < 4 || fields[0].empty()) {
            continue;
        }

        GPUInfo gpu;
        gpu.name = fields[0];
        try {
            // nvidia-smi reports MiB
            gpu.vram_total = std::stoull(fields[1]) * BYTES_PER_MB;
            gpu.vram_used = std::stoull(fields[2]) * BYTES_PER_MB;
        } catch (const std::exception&) {
            // "[N/A]" on some virtualized GPUs; keep the device with unknown sizes
            gpu.vram_total = 0;
            gpu.vram_used = 0;
        }
        gpu.driver_version = fields[3];
        gpus.push_back(gpu);
    }
    return gpus;
}

std::unique_ptr<SystemInfo> create_system_info() {
#ifdef __linux__
    return std::make_unique<LinuxSystemInfo>();
#else
    // No hardware detection: unknown memory never marks a model incompatible
    SystemSpecs specs;
    specs.os_name = "unknown";
    return std::make_unique<StaticSystemInfo>(specs);
#endif
}

} // namespace dock
