/**
 * @file msgunpack.hpp
 * @brief High-level msgunpack API.
 *
 * Whole-buffer entry points: unpackb() decodes the first value of a byte
 * buffer, packb() encodes a value into a fresh byte vector.
 */

#ifndef MSGUNPACK_HPP
#define MSGUNPACK_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "bytebuffer.hpp"
#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "ext_registry.hpp"
#include "packer.hpp"
#include "tag.hpp"
#include "unpacker.hpp"
#include "value.hpp"

namespace msgunpack {

/**
 * @brief Decode the first value of a byte buffer.
 *
 * Bytes following the first value are ignored.
 *
 * @param data Encoded bytes (may be null only if size is 0)
 * @param size Number of bytes available
 * @param[out] out Decoded value
 * @param options Decoding configuration
 * @return Error::Ok on success, Error::InvalidArg for a null buffer with
 *         nonzero size, otherwise the decode error
 */
Error unpackb(const std::uint8_t* data, std::size_t size, Value& out,
              const UnpackOptions& options = {});

/**
 * @brief Encode a value into a byte vector.
 *
 * @param value Value to encode
 * @param[out] out Encoded bytes (replaced)
 * @return Error::Ok on success, Error::Overflow if a length exceeds 2^32-1
 */
Error packb(const Value& value, std::vector<std::uint8_t>& out);

#if !MSGUNPACK_NO_EXCEPTIONS

/**
 * @brief Decode the first value of a byte buffer, throwing on failure.
 *
 * @throws UnpackException subclass matching the decode error
 */
Value unpackb(std::span<const std::uint8_t> data, const UnpackOptions& options = {});

/**
 * @brief Encode a value, throwing on failure.
 *
 * @throws OverflowException if a length exceeds 2^32-1
 */
std::vector<std::uint8_t> packb(const Value& value);

#endif // !MSGUNPACK_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace msgunpack

#endif // MSGUNPACK_HPP
