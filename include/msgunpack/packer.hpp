/**
 * @file packer.hpp
 * @brief MessagePack encoding of Values.
 *
 * Mirror image of the unpacker. Every value takes its smallest encoding:
 * - Integers: fixint, then 8/16/32/64-bit (unsigned for non-negative)
 * - Floats: float64
 * - Strings: fixstr, str 8/16/32
 * - Binaries: bin 8/16/32
 * - Arrays (lists and tuples alike): fixarray, array 16/32
 * - Maps, in entry order: fixmap, map 16/32
 * - Extension objects: fixext for 1/2/4/8/16-byte payloads, else ext 8/16/32
 */

#ifndef MSGUNPACK_PACKER_HPP
#define MSGUNPACK_PACKER_HPP

#include "bytebuffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace msgunpack {

/**
 * @brief Append the encoding of a value.
 *
 * @param buffer Output buffer
 * @param value Value to encode
 * @return Error::Ok on success, Error::Overflow if a length exceeds
 *         2^32-1 or the buffer limit is reached (buffer contents are then
 *         unspecified)
 */
Error pack(ByteBuffer& buffer, const Value& value);

} // namespace msgunpack

#endif // MSGUNPACK_PACKER_HPP
