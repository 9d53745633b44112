#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model_types.h"

namespace dock {

using json = nlohmann::json;

struct GPUInfo {
    std::string name;
    uint64_t vram_total = 0;  // bytes
    uint64_t vram_used = 0;   // bytes
    std::string driver_version;
};

// Hardware snapshot. Sizes are bytes; zero means the value could not be read.
struct SystemSpecs {
    std::string os_name;
    std::string os_version;
    std::string cpu_model;
    int cpu_cores = 0;
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    std::vector<GPUInfo> gpus;

    uint64_t total_vram() const;
};

void to_json(json& j, const GPUInfo& gpu);
void to_json(json& j, const SystemSpecs& specs);

// Advisory only: an incompatible model can still be installed and launched
struct Compatibility {
    bool compatible = true;
    std::string reason;  // empty when compatible
};

// RAM below min_ram fails. VRAM is only checked when the model asks for it and
// at least one GPU reports a size. Unknown memory (zero) never fails a model.
Compatibility check_compatibility(const ModelRequirements& requirements, const SystemSpecs& specs);

class SystemInfo {
public:
    virtual ~SystemInfo() = default;

    virtual SystemSpecs get_specs() = 0;
};

// Reads /proc and /etc/os-release, asks nvidia-smi about GPUs.
// A missing source leaves its field at the default.
class LinuxSystemInfo : public SystemInfo {
public:
    SystemSpecs get_specs() override;

    std::string get_os_version();
    std::string get_processor_name();
    std::vector<GPUInfo> get_nvidia_gpus();

    // Parsers over the raw text, exposed so the formats can be tested
    static bool parse_meminfo(std::istream& in, uint64_t& total, uint64_t& used);
    static void parse_cpuinfo(std::istream& in, std::string& model, int& cores);
    static std::vector<GPUInfo> parse_nvidia_smi(const std::string& csv);
};

// Fixed answer, for tests and for hosts that want to skip hardware detection
class StaticSystemInfo : public SystemInfo {
public:
    explicit StaticSystemInfo(SystemSpecs specs) : specs_(std::move(specs)) {}

    SystemSpecs get_specs() override { return specs_; }

private:
    SystemSpecs specs_;
};

std::unique_ptr<SystemInfo> create_system_info();

} // namespace dock
