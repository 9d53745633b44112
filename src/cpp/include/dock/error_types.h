#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace dock {

using json = nlohmann::json;

enum class ErrorCode {
    NOT_FOUND,
    DOWNLOAD_ERROR,
    DEPENDENCY_INSTALL_ERROR,
    PROCESS_SPAWN_ERROR,
    HEALTH_CHECK_TIMEOUT,
    TOKENIZATION_ERROR,
    DECODE_ERROR,
    LOCK_ACQUISITION_ERROR,
    MODEL_NOT_LOADED,
    MODEL_LOAD_ERROR,
    UNSUPPORTED_OPERATION,
    INVALID_REQUEST,
    CATALOG_ERROR,
    STORAGE_ERROR,
    INTERNAL_ERROR
};

std::string error_code_to_string(ErrorCode code);

// Base class for every error the core surfaces to the host.
// The message is shown to the user verbatim.
class DockException : public std::runtime_error {
public:
    DockException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class NotFoundException : public DockException {
public:
    explicit NotFoundException(const std::string& message)
        : DockException(ErrorCode::NOT_FOUND, message) {}
};

class DownloadException : public DockException {
public:
    explicit DownloadException(const std::string& message)
        : DockException(ErrorCode::DOWNLOAD_ERROR, message) {}
};

class DependencyInstallException : public DockException {
public:
    DependencyInstallException(const std::string& message, const std::string& output = "")
        : DockException(ErrorCode::DEPENDENCY_INSTALL_ERROR,
                        output.empty() ? message : message + ": " + output),
          output_(output) {}

    // Captured package manager output (stdout + stderr)
    const std::string& output() const { return output_; }

private:
    std::string output_;
};

class ProcessSpawnException : public DockException {
public:
    explicit ProcessSpawnException(const std::string& message)
        : DockException(ErrorCode::PROCESS_SPAWN_ERROR, message) {}
};

class HealthCheckTimeoutException : public DockException {
public:
    HealthCheckTimeoutException(const std::string& service, int attempts)
        : DockException(ErrorCode::HEALTH_CHECK_TIMEOUT,
                        service + " did not become healthy after " +
                        std::to_string(attempts) + " attempts") {}
};

class TokenizationException : public DockException {
public:
    explicit TokenizationException(const std::string& message)
        : DockException(ErrorCode::TOKENIZATION_ERROR, message) {}
};

class DecodeException : public DockException {
public:
    explicit DecodeException(const std::string& message)
        : DockException(ErrorCode::DECODE_ERROR, message) {}
};

class LockAcquisitionException : public DockException {
public:
    explicit LockAcquisitionException(const std::string& what)
        : DockException(ErrorCode::LOCK_ACQUISITION_ERROR,
                        "Timed out waiting for exclusive access to " + what) {}
};

class ModelNotLoadedException : public DockException {
public:
    ModelNotLoadedException()
        : DockException(ErrorCode::MODEL_NOT_LOADED, "No model loaded") {}
};

class ModelLoadException : public DockException {
public:
    explicit ModelLoadException(const std::string& message)
        : DockException(ErrorCode::MODEL_LOAD_ERROR, message) {}
};

class UnsupportedOperationException : public DockException {
public:
    UnsupportedOperationException(const std::string& operation, const std::string& target)
        : DockException(ErrorCode::UNSUPPORTED_OPERATION,
                        operation + " is not supported for " + target) {}
};

class InvalidRequestException : public DockException {
public:
    explicit InvalidRequestException(const std::string& message)
        : DockException(ErrorCode::INVALID_REQUEST, message) {}
};

class CatalogException : public DockException {
public:
    explicit CatalogException(const std::string& message)
        : DockException(ErrorCode::CATALOG_ERROR, message) {}
};

// Filesystem operation on the data directory failed
class StorageException : public DockException {
public:
    explicit StorageException(const std::string& message)
        : DockException(ErrorCode::STORAGE_ERROR, message) {}
};

class ErrorResponse {
public:
    // {"error": {"code": "...", "message": "..."}}
    static json from_exception(const DockException& e);
    static json from_exception(const std::exception& e);

    // HTTP status the control server answers with for a given code
    static int http_status(ErrorCode code);
};

} // namespace dock
