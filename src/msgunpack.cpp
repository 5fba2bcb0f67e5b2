/**
 * @file msgunpack.cpp
 * @brief Whole-buffer entry points.
 */

#include <msgunpack/msgunpack.hpp>

#include <utility>

namespace msgunpack {

Error unpackb(const std::uint8_t* data, std::size_t size, Value& out,
              const UnpackOptions& options) {
    if (data == nullptr && size != 0) {
        return Error::InvalidArg;
    }

    BufferSource source(data, size);
    ByteReader reader(source);
    return unpack(reader, options, out);
}

Error packb(const Value& value, std::vector<std::uint8_t>& out) {
    ByteBuffer buffer;
    auto status = pack(buffer, value);
    if (status != Error::Ok) {
        return status;
    }
    out = buffer.release();
    return Error::Ok;
}

#if !MSGUNPACK_NO_EXCEPTIONS

Value unpackb(std::span<const std::uint8_t> data, const UnpackOptions& options) {
    Value out;
    auto status = unpackb(data.data(), data.size(), out, options);
    if (status != Error::Ok) {
        throw_error(status, "unpackb");
    }
    return out;
}

std::vector<std::uint8_t> packb(const Value& value) {
    std::vector<std::uint8_t> out;
    auto status = packb(value, out);
    if (status != Error::Ok) {
        throw_error(status, "packb");
    }
    return out;
}

#endif // !MSGUNPACK_NO_EXCEPTIONS

} // namespace msgunpack
