#pragma once

#include <stdexcept>
#include <string>

namespace later {

// Base of every error the engine raises on purpose.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Page could not be fetched or held no usable content.
class ExtractionError : public Error {
public:
    explicit ExtractionError(const std::string& message) : Error(message) {}
};

// A provider (LLM, embedding, rerank, extraction transport) rejected or failed a request.
class ProviderError : public Error {
public:
    ProviderError(const std::string& message, long httpStatus = 0, bool transient = false)
        : Error(message), httpStatus_(httpStatus), transient_(transient) {}

    long httpStatus() const { return httpStatus_; }

    // Rate limits, 5xx responses, dropped connections and timeouts are worth retrying.
    bool transient() const { return transient_; }

private:
    long httpStatus_;
    bool transient_;
};

// Bounded wait exceeded. Always transient.
class ProviderTimeoutError : public ProviderError {
public:
    explicit ProviderTimeoutError(const std::string& message)
        : ProviderError(message, 0, true) {}
};

// Too few points for the requested projection or clustering.
class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& message) : Error(message) {}
};

// Duplicate (user, url) or (user, canonical_url).
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message) : Error(message) {}
};

// Out-of-range parameter or malformed structured response.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(message) {}
};

// Underlying SQLite failure that is not a constraint violation.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message) : Error(message) {}
};

} // namespace later
