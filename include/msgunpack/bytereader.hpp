/**
 * @file bytereader.hpp
 * @brief Sequential exact-count byte reading.
 *
 * A Source hands out bytes in chunks of any size it likes. The ByteReader
 * on top of it accumulates those chunks until a request is satisfied, so
 * decoding never depends on how the data was split.
 */

#ifndef MSGUNPACK_BYTEREADER_HPP
#define MSGUNPACK_BYTEREADER_HPP

#include <cstddef>
#include <cstdint>

#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace msgunpack {

/**
 * @brief Producer of raw bytes.
 */
class Source {
public:
    virtual ~Source() = default;

    /**
     * @brief Copy up to n bytes into dst.
     *
     * May return fewer bytes than requested. Returns 0 only once the
     * source is exhausted.
     *
     * @param dst Destination buffer of at least n bytes
     * @param n Maximum number of bytes to copy (greater than 0)
     * @return Number of bytes copied
     */
    virtual std::size_t read(std::uint8_t* dst, std::size_t n) = 0;
};

/**
 * @brief Source over a caller-owned in-memory buffer.
 *
 * Does not take ownership of the buffer and never writes to it.
 */
class BufferSource final : public Source {
public:
    BufferSource(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    std::size_t read(std::uint8_t* dst, std::size_t n) override;

    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - pos_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Exact-count reader over a Source.
 */
class ByteReader {
public:
    explicit ByteReader(Source& source) noexcept : source_(source), position_(0) {}

    ByteReader(const ByteReader&) = delete;
    ByteReader& operator=(const ByteReader&) = delete;

    /**
     * @brief Read exactly n bytes.
     *
     * Loops over the source until n bytes have been accumulated. A
     * request for zero bytes succeeds without touching the source.
     *
     * @param dst Destination buffer of at least n bytes
     * @param n Number of bytes to read
     * @return Error::Ok, or Error::InsufficientData if the source ran dry
     */
    Error read_exact(std::uint8_t* dst, std::size_t n);

    /**
     * @brief Read a payload of n bytes into a growing buffer.
     *
     * The buffer grows by at most READ_CHUNK_BYTES per step, so a large
     * declared length is only allocated as its bytes actually arrive.
     *
     * @param n Payload length
     * @param[out] out Payload bytes (replaced)
     * @return Error::Ok or Error::InsufficientData
     */
    Error read_payload(std::size_t n, Binary& out);

    /**
     * @brief Read one byte.
     */
    Error read_u8(std::uint8_t& value);

    /**
     * @brief Read a big-endian unsigned field of 1, 2, 4 or 8 bytes.
     *
     * @param width Field width in bytes
     * @param[out] value Decoded value, zero-extended
     * @return Error::Ok, Error::InsufficientData, or Error::InvalidArg
     *         for an unsupported width
     */
    Error read_be(std::size_t width, std::uint64_t& value);

    /**
     * @brief Number of bytes consumed so far.
     */
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    Source& source_;
    std::size_t position_;
};

} // namespace msgunpack

#endif // MSGUNPACK_BYTEREADER_HPP
