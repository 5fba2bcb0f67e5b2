/**
 * @file unpacker.hpp
 * @brief Recursive-descent MessagePack decoding.
 *
 * Reads one tag byte, classifies it, and lets the matching routine consume
 * exactly the bytes the tag declares, recursing for array elements and map
 * entries. Any failure aborts the whole decode; no partial result is kept.
 */

#ifndef MSGUNPACK_UNPACKER_HPP
#define MSGUNPACK_UNPACKER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace msgunpack {

/// Per-call extension decoder
using ExtHandler = std::function<Value(const Ext&)>;

/**
 * @brief Decoding configuration.
 *
 * Passed unchanged to every nested decode.
 */
struct UnpackOptions {
    /// Decode arrays as tuples instead of lists
    bool use_tuple = false;

    /// Decode maps with significant insertion order
    bool use_ordered_dict = false;

    /// Return invalid UTF-8 string payloads as Binary instead of failing
    bool allow_invalid_utf8 = false;

    /// Extension decoders by type identifier, consulted before ext_registry()
    std::unordered_map<std::int8_t, ExtHandler> ext_handlers;

    /// Deepest array/map nesting accepted; 0 rejects every array and map
    std::size_t max_depth = MAX_DEPTH;
};

/**
 * @brief Decode one value.
 *
 * @param reader Reader positioned at a tag byte
 * @param options Decoding configuration
 * @param[out] out Decoded value (unspecified on failure)
 * @return Error::Ok on success, otherwise the first error encountered
 */
Error unpack(ByteReader& reader, const UnpackOptions& options, Value& out);

} // namespace msgunpack

#endif // MSGUNPACK_UNPACKER_HPP
