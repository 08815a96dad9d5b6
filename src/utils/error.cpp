#include "securand/error.hpp"
#include <sstream>

namespace securand {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::InvalidRange: return "Invalid range";
        case ErrorCode::InvalidLength: return "Invalid length";
        case ErrorCode::InvalidCharset: return "Invalid charset";
        case ErrorCode::EmptySequence: return "Empty sequence";

        case ErrorCode::EntropyUnavailable: return "Entropy unavailable";

        case ErrorCode::ConfigLoadFailed: return "Config load failed";
        case ErrorCode::ConfigParseFailed: return "Config parse failed";

        default: return "Unknown error code";
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

} // namespace securand
