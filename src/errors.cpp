#include "errors.hpp"

namespace issue_harvest {

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Transport:         return "transport";
        case ErrorCategory::HttpStatus:        return "http-status";
        case ErrorCategory::MalformedResponse: return "malformed-response";
        case ErrorCategory::RetriesExhausted:  return "retries-exhausted";
        case ErrorCategory::Storage:           return "storage";
    }
    return "unknown";
}

FetchError::FetchError(ErrorCategory category, const std::string& message)
    : std::runtime_error(message)
    , mCategory(category) {}

bool isTransient(ErrorCategory category) {
    return category == ErrorCategory::Transport;
}

} // namespace issue_harvest
