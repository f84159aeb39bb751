#pragma once

#include <string>

namespace relay {

/**
 * @brief Failure taxonomy shared by every stage of the transfer pipeline
 *
 * Configuration errors are fatal at startup. The other kinds are scoped to a
 * single request and end up in a TransferResult.
 */
enum class ErrorKind {
    Configuration,
    Acquisition,
    Upload,
    Staging
};

struct Error {
    ErrorKind kind = ErrorKind::Acquisition;
    std::string message;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Acquisition: return "AcquisitionError";
        case ErrorKind::Upload: return "UploadError";
        case ErrorKind::Staging: return "StagingError";
    }
    return "Error";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace relay
