#include "dock/utils/json_utils.h"
#include "dock/error_types.h"
#include <fstream>

namespace dock {
namespace utils {

json JsonUtils::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open JSON file: " + path);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON file " + path + ": " + e.what());
    }
}

json JsonUtils::parse_request(const std::string& body) {
    if (body.empty()) {
        return json::object();
    }

    try {
        json request = json::parse(body);
        if (!request.is_object()) {
            throw InvalidRequestException("Request body must be a JSON object");
        }
        return request;
    } catch (const json::parse_error& e) {
        throw InvalidRequestException(std::string("Malformed JSON in request body: ") + e.what());
    }
}

} // namespace utils
} // namespace dock
