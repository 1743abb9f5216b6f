#pragma once

#include <stdexcept>
#include <string>

namespace issue_harvest {

/// How a failed fetch step is classified.  The category decides whether the
/// retry policy tries again or the page loop aborts.
enum class ErrorCategory {
    Transport,          // timeout, refused/reset connection, DNS failure
    HttpStatus,         // non-2xx response other than 429
    MalformedResponse,  // 2xx response that is not JSON or lacks total/issues
    RetriesExhausted,   // transport retries used up
    Storage,            // page batch could not be persisted
};

const char* toString(ErrorCategory category);

/// Error raised by the fetch pipeline.  Only Transport is transient.
class FetchError : public std::runtime_error {
public:
    FetchError(ErrorCategory category, const std::string& message);

    ErrorCategory category() const { return mCategory; }

private:
    ErrorCategory mCategory;
};

/// Thrown from inside the page loop once an interrupt was requested, so the
/// loop unwinds without touching the last saved checkpoint.
class Interrupted : public std::runtime_error {
public:
    Interrupted() : std::runtime_error("interrupted") {}
};

/// Default retry predicate: only transport failures are worth another try.
bool isTransient(ErrorCategory category);

} // namespace issue_harvest
