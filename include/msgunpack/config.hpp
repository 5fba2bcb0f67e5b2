/**
 * @file config.hpp
 * @brief msgunpack compile-time configuration.
 *
 * MessagePack decoding library. Wire format as published at
 * https://msgpack.org.
 */

#ifndef MSGUNPACK_CONFIG_HPP
#define MSGUNPACK_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace msgunpack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default nesting bound for arrays and maps
#ifndef MSGUNPACK_MAX_DEPTH
#define MSGUNPACK_MAX_DEPTH 512U
#endif

/// Largest single growth step while reading a declared-length payload
#ifndef MSGUNPACK_READ_CHUNK
#define MSGUNPACK_READ_CHUNK 65536U
#endif

inline constexpr std::size_t MAX_DEPTH = MSGUNPACK_MAX_DEPTH;
inline constexpr std::size_t READ_CHUNK_BYTES = MSGUNPACK_READ_CHUNK;

/// Upper bound for up-front element reservation in arrays and maps
inline constexpr std::size_t MAX_RESERVE = 4096U;

/// Largest length any MessagePack length field can carry
inline constexpr std::uint64_t MAX_LENGTH = 0xFFFFFFFFULL;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MSGUNPACK_NO_EXCEPTIONS=1 to compile out the exception classes and
 * the throwing convenience API. The error-code API is always available.
 * @{
 */
#ifndef MSGUNPACK_NO_EXCEPTIONS
#define MSGUNPACK_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace msgunpack

#endif // MSGUNPACK_CONFIG_HPP
