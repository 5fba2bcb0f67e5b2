/**
 * @file error.cpp
 * @brief Error code to exception mapping.
 */

#include <msgunpack/error.hpp>

#if !MSGUNPACK_NO_EXCEPTIONS

namespace msgunpack {

void throw_error(Error error, const std::string& context) {
    std::string message = context.empty() ? std::string(error_string(error))
                                          : context + ": " + error_string(error);

    switch (error) {
    case Error::InsufficientData:
        throw InsufficientDataException(message);
    case Error::ReservedCode:
        throw ReservedCodeException(message);
    case Error::InvalidString:
        throw InvalidStringException(message);
    case Error::UnhashableKey:
        throw UnhashableKeyException(message);
    case Error::DuplicateKey:
        throw DuplicateKeyException(message);
    case Error::NotImplemented:
        throw NotImplementedException(message);
    case Error::DepthExceeded:
        throw DepthExceededException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::Ok:
    case Error::InvalidArg:
    default:
        throw InvalidArgumentException(message);
    }
}

} // namespace msgunpack

#endif // !MSGUNPACK_NO_EXCEPTIONS
