#include "tinyboard/error.hpp"
#include <sstream>

namespace tinyboard {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotImplemented: return "Not implemented";

        case ErrorCode::ValidationFailed: return "Validation failed";
        case ErrorCode::NotFound: return "Not found";

        case ErrorCode::UnsupportedMediaType: return "Unsupported media type";
        case ErrorCode::InvalidMedia: return "Invalid media";
        case ErrorCode::PayloadTooLarge: return "Payload too large";
        case ErrorCode::IoError: return "I/O error";

        case ErrorCode::StoreReadFailed: return "Store read failed";
        case ErrorCode::StoreWriteFailed: return "Store write failed";
        case ErrorCode::StoreCorrupted: return "Store corrupted";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";

        default: return "Unknown error code";
    }
}

bool is_client_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationFailed:
        case ErrorCode::NotFound:
        case ErrorCode::UnsupportedMediaType:
        case ErrorCode::InvalidMedia:
        case ErrorCode::PayloadTooLarge:
            return true;
        default:
            return false;
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace tinyboard
