/**
 * @file bytereader.cpp
 * @brief Source and ByteReader implementation.
 */

#include <msgunpack/bytereader.hpp>

#include <algorithm>
#include <cstring>

namespace msgunpack {

std::size_t BufferSource::read(std::uint8_t* dst, std::size_t n) {
    std::size_t count = std::min(n, size_ - pos_);
    if (count > 0) {
        std::memcpy(dst, data_ + pos_, count);
        pos_ += count;
    }
    return count;
}

Error ByteReader::read_exact(std::uint8_t* dst, std::size_t n) {
    if (n == 0) {
        return Error::Ok;
    }

    std::size_t got = source_.read(dst, n);
    if (got == 0) {
        return Error::InsufficientData;
    }

    // Sources may deliver short chunks; keep reading until satisfied
    while (got < n) {
        std::size_t chunk = source_.read(dst + got, n - got);
        if (chunk == 0) {
            position_ += got;
            return Error::InsufficientData;
        }
        got += chunk;
    }

    position_ += got;
    return Error::Ok;
}

Error ByteReader::read_payload(std::size_t n, Binary& out) {
    out.clear();
    if (n == 0) {
        return Error::Ok;
    }

    std::size_t filled = 0;
    while (filled < n) {
        std::size_t step = std::min(n - filled, READ_CHUNK_BYTES);
        out.resize(filled + step);
        auto status = read_exact(out.data() + filled, step);
        if (status != Error::Ok) {
            return status;
        }
        filled += step;
    }

    return Error::Ok;
}

Error ByteReader::read_u8(std::uint8_t& value) {
    return read_exact(&value, 1);
}

Error ByteReader::read_be(std::size_t width, std::uint64_t& value) {
    if (width != 1 && width != 2 && width != 4 && width != 8) [[unlikely]] {
        return Error::InvalidArg;
    }

    std::uint8_t bytes[8];
    auto status = read_exact(bytes, width);
    if (status != Error::Ok) {
        return status;
    }

    std::uint64_t result = 0;
    for (std::size_t i = 0; i < width; ++i) {
        result = (result << 8) | bytes[i];
    }
    value = result;
    return Error::Ok;
}

} // namespace msgunpack
