#include "dock/error_types.h"

namespace dock {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:                return "not_found";
        case ErrorCode::DOWNLOAD_ERROR:           return "download_error";
        case ErrorCode::DEPENDENCY_INSTALL_ERROR: return "dependency_install_error";
        case ErrorCode::PROCESS_SPAWN_ERROR:      return "process_spawn_error";
        case ErrorCode::HEALTH_CHECK_TIMEOUT:     return "health_check_timeout";
        case ErrorCode::TOKENIZATION_ERROR:       return "tokenization_error";
        case ErrorCode::DECODE_ERROR:             return "decode_error";
        case ErrorCode::LOCK_ACQUISITION_ERROR:   return "lock_acquisition_error";
        case ErrorCode::MODEL_NOT_LOADED:         return "model_not_loaded";
        case ErrorCode::MODEL_LOAD_ERROR:         return "model_load_error";
        case ErrorCode::UNSUPPORTED_OPERATION:    return "unsupported_operation";
        case ErrorCode::INVALID_REQUEST:          return "invalid_request";
        case ErrorCode::CATALOG_ERROR:            return "catalog_error";
        case ErrorCode::STORAGE_ERROR:            return "storage_error";
        case ErrorCode::INTERNAL_ERROR:           return "internal_error";
    }
    return "internal_error";
}

json ErrorResponse::from_exception(const DockException& e) {
    return {
        {"error", {
            {"code", error_code_to_string(e.code())},
            {"message", e.what()}
        }}
    };
}

json ErrorResponse::from_exception(const std::exception& e) {
    if (auto dock_error = dynamic_cast<const DockException*>(&e)) {
        return from_exception(*dock_error);
    }
    return {
        {"error", {
            {"code", error_code_to_string(ErrorCode::INTERNAL_ERROR)},
            {"message", e.what()}
        }}
    };
}

int ErrorResponse::http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:
            return 404;
        case ErrorCode::INVALID_REQUEST:
            return 400;
        case ErrorCode::UNSUPPORTED_OPERATION:
            return 422;
        case ErrorCode::MODEL_NOT_LOADED:
            return 409;
        case ErrorCode::LOCK_ACQUISITION_ERROR:
            return 503;
        case ErrorCode::HEALTH_CHECK_TIMEOUT:
            return 504;
        default:
            return 500;
    }
}

} // namespace dock
