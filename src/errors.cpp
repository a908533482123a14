#include "letters/errors.hpp"

#include <sstream>

namespace letters {

const char* error_origin_to_string(ErrorOrigin origin) {
    switch (origin) {
        case ORIGIN_LOCAL:   return "local";
        case ORIGIN_NETWORK: return "network";
        case ORIGIN_SERVER:  return "server";
    }
    return "unknown";
}

std::string LetterError::format() const {
    std::ostringstream out;
    out << "[" << error_origin_to_string(origin_) << "] " << what();
    if (!code_.empty()) out << "\n  code: " << code_;
    if (http_status_ != 0) out << "\n  http_status: " << http_status_;
    if (!detail_.empty()) out << "\n  detail: " << detail_;
    if (!field_.empty()) out << "\n  field: " << field_;
    return out.str();
}

static std::string timeout_message(int timeout_ms) {
    std::ostringstream oss;
    oss << "Request timed out after " << (timeout_ms / 1000.0) << " seconds";
    return oss.str();
}

TimeoutError::TimeoutError(int timeout_ms)
    : NetworkError(timeout_message(timeout_ms))
{}

} // namespace letters
