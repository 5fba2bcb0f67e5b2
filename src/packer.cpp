/**
 * @file packer.cpp
 * @brief Value encoding.
 */

#include <msgunpack/packer.hpp>

#include <msgunpack/tag.hpp>

#include <bit>
#include <cstdint>
#include <string>

namespace msgunpack {

namespace {

/**
 * @brief Append a tag followed by a length field of the smallest width.
 *
 * @param codes Tags for 8-, 16- and 32-bit length fields; a zero entry
 *        means that width does not exist for the category
 */
Error pack_length(ByteBuffer& buffer, std::uint64_t length, const std::uint8_t (&codes)[3]) {
    if (length > MAX_LENGTH) {
        return Error::Overflow;
    }

    if (codes[0] != 0 && length <= 0xFFU) {
        auto status = buffer.append_u8(codes[0]);
        return status == Error::Ok ? buffer.append_be(length, 1) : status;
    }
    if (length <= 0xFFFFU) {
        auto status = buffer.append_u8(codes[1]);
        return status == Error::Ok ? buffer.append_be(length, 2) : status;
    }
    auto status = buffer.append_u8(codes[2]);
    return status == Error::Ok ? buffer.append_be(length, 4) : status;
}

Error pack_unsigned(ByteBuffer& buffer, std::uint64_t v) {
    if (v <= 0x7FU) {
        return buffer.append_u8(static_cast<std::uint8_t>(v));
    }

    std::uint8_t code = tag::UInt64;
    std::size_t width = 8;
    if (v <= 0xFFU) {
        code = tag::UInt8;
        width = 1;
    } else if (v <= 0xFFFFU) {
        code = tag::UInt16;
        width = 2;
    } else if (v <= 0xFFFFFFFFU) {
        code = tag::UInt32;
        width = 4;
    }

    auto status = buffer.append_u8(code);
    return status == Error::Ok ? buffer.append_be(v, width) : status;
}

Error pack_signed(ByteBuffer& buffer, std::int64_t v) {
    if (v >= -32) {
        return buffer.append_u8(static_cast<std::uint8_t>(v));
    }

    std::uint8_t code = tag::Int64;
    std::size_t width = 8;
    if (v >= INT8_MIN) {
        code = tag::Int8;
        width = 1;
    } else if (v >= INT16_MIN) {
        code = tag::Int16;
        width = 2;
    } else if (v >= INT32_MIN) {
        code = tag::Int32;
        width = 4;
    }

    auto status = buffer.append_u8(code);
    // Two's complement bits, truncated to the field width by append_be
    return status == Error::Ok ? buffer.append_be(static_cast<std::uint64_t>(v), width) : status;
}

Error pack_ext(ByteBuffer& buffer, const Ext& ext) {
    std::size_t length = ext.data.size();
    Error status = Error::Ok;

    switch (length) {
    case 1:
        status = buffer.append_u8(tag::FixExt1);
        break;
    case 2:
        status = buffer.append_u8(tag::FixExt2);
        break;
    case 4:
        status = buffer.append_u8(tag::FixExt4);
        break;
    case 8:
        status = buffer.append_u8(tag::FixExt8);
        break;
    case 16:
        status = buffer.append_u8(tag::FixExt16);
        break;
    default: {
        static constexpr std::uint8_t codes[3] = {tag::Ext8, tag::Ext16, tag::Ext32};
        status = pack_length(buffer, length, codes);
        break;
    }
    }
    if (status != Error::Ok) {
        return status;
    }

    status = buffer.append_u8(static_cast<std::uint8_t>(ext.type));
    if (status != Error::Ok) {
        return status;
    }
    return buffer.append_bytes(ext.data.data(), length);
}

} // namespace

Error pack(ByteBuffer& buffer, const Value& value) {
    switch (value.type()) {
    case Value::Type::Nil:
        return buffer.append_u8(tag::Nil);

    case Value::Type::Boolean:
        return buffer.append_u8(value.as_bool() ? tag::True : tag::False);

    case Value::Type::Integer:
        if (value.is_negative()) {
            return pack_signed(buffer, value.as_int64());
        }
        return pack_unsigned(buffer, value.as_uint64());

    case Value::Type::Float: {
        auto status = buffer.append_u8(tag::Float64);
        if (status != Error::Ok) {
            return status;
        }
        return buffer.append_be(std::bit_cast<std::uint64_t>(value.as_double()), 8);
    }

    case Value::Type::String: {
        const std::string& s = value.as_string();
        Error status;
        if (s.size() <= 31) {
            status = buffer.append_u8(static_cast<std::uint8_t>(tag::FixStr | s.size()));
        } else {
            static constexpr std::uint8_t codes[3] = {tag::Str8, tag::Str16, tag::Str32};
            status = pack_length(buffer, s.size(), codes);
        }
        if (status != Error::Ok) {
            return status;
        }
        return buffer.append_bytes(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    }

    case Value::Type::Binary: {
        const Binary& bin = value.as_binary();
        static constexpr std::uint8_t codes[3] = {tag::Bin8, tag::Bin16, tag::Bin32};
        auto status = pack_length(buffer, bin.size(), codes);
        if (status != Error::Ok) {
            return status;
        }
        return buffer.append_bytes(bin.data(), bin.size());
    }

    case Value::Type::Array: {
        const Array& array = value.as_array();
        Error status;
        if (array.size() <= 15) {
            status = buffer.append_u8(static_cast<std::uint8_t>(tag::FixArray | array.size()));
        } else {
            static constexpr std::uint8_t codes[3] = {0, tag::Array16, tag::Array32};
            status = pack_length(buffer, array.size(), codes);
        }
        for (auto it = array.begin(); status == Error::Ok && it != array.end(); ++it) {
            status = pack(buffer, *it);
        }
        return status;
    }

    case Value::Type::Map: {
        const Map& map = value.as_map();
        Error status;
        if (map.size() <= 15) {
            status = buffer.append_u8(static_cast<std::uint8_t>(tag::FixMap | map.size()));
        } else {
            static constexpr std::uint8_t codes[3] = {0, tag::Map16, tag::Map32};
            status = pack_length(buffer, map.size(), codes);
        }
        for (auto it = map.begin(); status == Error::Ok && it != map.end(); ++it) {
            status = pack(buffer, it->first);
            if (status == Error::Ok) {
                status = pack(buffer, it->second);
            }
        }
        return status;
    }

    case Value::Type::Ext:
        return pack_ext(buffer, value.as_ext());
    }

    return Error::InvalidArg;
}

} // namespace msgunpack
