/**
 * @file error.hpp
 * @brief msgunpack error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * Every decode failure is terminal for the call that produced it.
 */

#ifndef MSGUNPACK_ERROR_HPP
#define MSGUNPACK_ERROR_HPP

#include "config.hpp"

#if !MSGUNPACK_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace msgunpack {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                ///< Success
    InsufficientData = -1, ///< Source exhausted before the declared byte count
    ReservedCode = -2,     ///< Reserved tag byte 0xc1
    InvalidString = -3,    ///< String payload is not valid UTF-8
    UnhashableKey = -4,    ///< Map key cannot serve as a key
    DuplicateKey = -5,     ///< Map key repeats an earlier key of the same map
    NotImplemented = -6,   ///< Registered extension type cannot decode
    DepthExceeded = -7,    ///< Nesting deeper than the configured bound
    InvalidArg = -8,       ///< Invalid argument
    Overflow = -9          ///< Value too large to encode, or output full
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InsufficientData:
        return "Insufficient data";
    case Error::ReservedCode:
        return "Reserved code 0xc1";
    case Error::InvalidString:
        return "String is invalid UTF-8";
    case Error::UnhashableKey:
        return "Unhashable map key";
    case Error::DuplicateKey:
        return "Duplicate map key";
    case Error::NotImplemented:
        return "Extension type lacks an unpack function";
    case Error::DepthExceeded:
        return "Maximum nesting depth exceeded";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Value too large";
    default:
        return "Unknown error";
    }
}

#if !MSGUNPACK_NO_EXCEPTIONS

/**
 * @brief Base exception for msgunpack errors.
 */
class UnpackException : public std::runtime_error {
public:
    explicit UnpackException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for input that ends before a value is complete.
 */
class InsufficientDataException : public UnpackException {
public:
    explicit InsufficientDataException(const std::string& message)
        : UnpackException(message, Error::InsufficientData) {}
};

/**
 * @brief Exception for the reserved tag byte 0xc1.
 */
class ReservedCodeException : public UnpackException {
public:
    explicit ReservedCodeException(const std::string& message)
        : UnpackException(message, Error::ReservedCode) {}
};

/**
 * @brief Exception for string payloads that are not valid UTF-8.
 */
class InvalidStringException : public UnpackException {
public:
    explicit InvalidStringException(const std::string& message)
        : UnpackException(message, Error::InvalidString) {}
};

/**
 * @brief Exception for map keys that cannot be hashed.
 */
class UnhashableKeyException : public UnpackException {
public:
    explicit UnhashableKeyException(const std::string& message)
        : UnpackException(message, Error::UnhashableKey) {}
};

/**
 * @brief Exception for a map key that repeats an earlier one.
 */
class DuplicateKeyException : public UnpackException {
public:
    explicit DuplicateKeyException(const std::string& message)
        : UnpackException(message, Error::DuplicateKey) {}
};

/**
 * @brief Exception for registered extension types without a decoder.
 */
class NotImplementedException : public UnpackException {
public:
    explicit NotImplementedException(const std::string& message)
        : UnpackException(message, Error::NotImplemented) {}
};

/**
 * @brief Exception for arrays and maps nested past the depth limit.
 */
class DepthExceededException : public UnpackException {
public:
    explicit DepthExceededException(const std::string& message)
        : UnpackException(message, Error::DepthExceeded) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public UnpackException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : UnpackException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for values the format cannot represent.
 */
class OverflowException : public UnpackException {
public:
    explicit OverflowException(const std::string& message)
        : UnpackException(message, Error::Overflow) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (must not be Error::Ok)
 * @param context Prefix for the exception message, may be empty
 */
[[noreturn]] void throw_error(Error error, const std::string& context = {});

#endif // !MSGUNPACK_NO_EXCEPTIONS

} // namespace msgunpack

#endif // MSGUNPACK_ERROR_HPP
