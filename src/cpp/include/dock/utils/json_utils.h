#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace dock {
namespace utils {

using json = nlohmann::json;

class JsonUtils {
public:
    // Parse a JSON file, throws std::runtime_error with the path on failure
    static json load_from_file(const std::string& path);

    // Parse a request body; malformed input becomes InvalidRequestException
    static json parse_request(const std::string& body);
};

} // namespace utils
} // namespace dock
