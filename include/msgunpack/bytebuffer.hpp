/**
 * @file bytebuffer.hpp
 * @brief Growable output buffer for encoded values.
 */

#ifndef MSGUNPACK_BYTEBUFFER_HPP
#define MSGUNPACK_BYTEBUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace msgunpack {

/**
 * @brief Append-only byte buffer with an optional size limit.
 *
 * A limit of zero means unbounded. Appends that would exceed the limit
 * fail with Error::Overflow and leave the buffer unchanged.
 */
class ByteBuffer {
public:
    ByteBuffer() = default;
    explicit ByteBuffer(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    /**
     * @brief Clear buffer to empty state.
     */
    void clear() noexcept { data_.clear(); }

    /**
     * @brief Get number of bytes in buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return data_; }

    /**
     * @brief Move the accumulated bytes out, leaving the buffer empty.
     */
    std::vector<std::uint8_t> release() noexcept;

    /**
     * @brief Append a single byte.
     * @return Error::Ok on success, Error::Overflow if the limit is reached
     */
    Error append_u8(std::uint8_t value);

    /**
     * @brief Append a value as a big-endian field.
     *
     * @param value Value to append (right-justified)
     * @param width Field width in bytes: 1, 2, 4 or 8
     * @return Error::Ok, Error::Overflow, or Error::InvalidArg for a bad width
     */
    Error append_be(std::uint64_t value, std::size_t width);

    /**
     * @brief Append raw bytes.
     */
    Error append_bytes(const std::uint8_t* bytes, std::size_t count);

private:
    std::vector<std::uint8_t> data_;
    std::size_t max_bytes_ = 0;

    [[nodiscard]] bool fits(std::size_t count) const noexcept {
        return max_bytes_ == 0 || (count <= max_bytes_ && data_.size() <= max_bytes_ - count);
    }
};

} // namespace msgunpack

#endif // MSGUNPACK_BYTEBUFFER_HPP
