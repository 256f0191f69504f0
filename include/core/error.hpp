#pragma once

#include <stdexcept>
#include <string>

namespace httpobf {

/**
 * @brief Error categories for obfuscation failures
 */
enum class ErrorCategory {
    NONE,
    NULL_ARGUMENT,
    DUPLICATE_KEY,
    ILLEGAL_CONFIGURATION,
    DECODING_ERROR,
    ENCODING_ERROR,
    INDEX_OUT_OF_RANGE,
    IO_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::NULL_ARGUMENT: return "NULL_ARGUMENT";
        case ErrorCategory::DUPLICATE_KEY: return "DUPLICATE_KEY";
        case ErrorCategory::ILLEGAL_CONFIGURATION: return "ILLEGAL_CONFIGURATION";
        case ErrorCategory::DECODING_ERROR: return "DECODING_ERROR";
        case ErrorCategory::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCategory::INDEX_OUT_OF_RANGE: return "INDEX_OUT_OF_RANGE";
        case ErrorCategory::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Base class of every error raised by the library
 *
 * Errors are never logged or retried internally; they surface to the
 * immediate caller. An engine instance stays usable after any of them.
 */
class ObfuscationError : public std::runtime_error {
public:
    ObfuscationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// A required argument (obfuscator, destination, character array) was null.
class NullArgumentError : public ObfuscationError {
public:
    explicit NullArgumentError(const std::string& message)
        : ObfuscationError(ErrorCategory::NULL_ARGUMENT, message) {}
};

/// An entry with the same name and case sensitivity was already added.
class DuplicateKeyError : public ObfuscationError {
public:
    explicit DuplicateKeyError(const std::string& message)
        : ObfuscationError(ErrorCategory::DUPLICATE_KEY, message) {}
};

/// Invalid builder setting, e.g. a negative limit.
class IllegalConfigurationError : public ObfuscationError {
public:
    explicit IllegalConfigurationError(const std::string& message)
        : ObfuscationError(ErrorCategory::ILLEGAL_CONFIGURATION, message) {}
};

/// Malformed percent-encoding.
class DecodingError : public ObfuscationError {
public:
    explicit DecodingError(const std::string& message)
        : ObfuscationError(ErrorCategory::DECODING_ERROR, message) {}
};

/// Text that cannot be represented in the configured character encoding.
class EncodingError : public ObfuscationError {
public:
    explicit EncodingError(const std::string& message)
        : ObfuscationError(ErrorCategory::ENCODING_ERROR, message) {}
};

/// Invalid span or sub-range arguments.
class IndexOutOfRangeError : public ObfuscationError {
public:
    explicit IndexOutOfRangeError(const std::string& message)
        : ObfuscationError(ErrorCategory::INDEX_OUT_OF_RANGE, message) {}
};

/// Failure reading from a source or writing to a destination.
class IOError : public ObfuscationError {
public:
    explicit IOError(const std::string& message)
        : ObfuscationError(ErrorCategory::IO_ERROR, message) {}
};

} // namespace httpobf
