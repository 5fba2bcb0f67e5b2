/**
 * @file bytebuffer.cpp
 * @brief ByteBuffer implementation.
 */

#include <msgunpack/bytebuffer.hpp>

#include <utility>

namespace msgunpack {

std::vector<std::uint8_t> ByteBuffer::release() noexcept {
    std::vector<std::uint8_t> out = std::move(data_);
    data_.clear();
    return out;
}

Error ByteBuffer::append_u8(std::uint8_t value) {
    if (!fits(1)) {
        return Error::Overflow;
    }
    data_.push_back(value);
    return Error::Ok;
}

Error ByteBuffer::append_be(std::uint64_t value, std::size_t width) {
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        return Error::InvalidArg;
    }
    if (!fits(width)) {
        return Error::Overflow;
    }

    // Most significant byte first
    for (std::size_t i = width; i > 0; --i) {
        data_.push_back(static_cast<std::uint8_t>(value >> ((i - 1) * 8)));
    }
    return Error::Ok;
}

Error ByteBuffer::append_bytes(const std::uint8_t* bytes, std::size_t count) {
    if (count == 0) {
        return Error::Ok;
    }
    if (bytes == nullptr) {
        return Error::InvalidArg;
    }
    if (!fits(count)) {
        return Error::Overflow;
    }
    data_.insert(data_.end(), bytes, bytes + count);
    return Error::Ok;
}

} // namespace msgunpack
