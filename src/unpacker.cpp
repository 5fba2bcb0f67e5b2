/**
 * @file unpacker.cpp
 * @brief Tag dispatch and per-category decode routines.
 */

#include <msgunpack/unpacker.hpp>

#include <msgunpack/ext_registry.hpp>
#include <msgunpack/tag.hpp>

#include <algorithm>
#include <bit>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>

namespace msgunpack {

namespace {

/**
 * @brief Report a tag routed to a routine that cannot handle it.
 *
 * classify() and the routines below disagree; this is a defect in this
 * file, never a property of the input.
 */
[[noreturn]] void unreachable_tag(const char* routine, std::uint8_t code) {
    std::fprintf(stderr, "msgunpack: %s routine received tag 0x%02x\n", routine,
                 static_cast<unsigned>(code));
    std::abort();
}

Error unpack_value(ByteReader& reader, const UnpackOptions& options, std::size_t depth,
                   Value& out);

Error read_length(ByteReader& reader, std::size_t width, std::size_t& length) {
    std::uint64_t raw = 0;
    auto status = reader.read_be(width, raw);
    if (status != Error::Ok) {
        return status;
    }
    length = static_cast<std::size_t>(raw);
    return Error::Ok;
}

Error unpack_integer(std::uint8_t code, ByteReader& reader, Value& out) {
    // Negative fixint: 111xxxxx, the whole byte is the two's complement value
    if ((code & 0xE0) == 0xE0) {
        out = Value(static_cast<std::int8_t>(code));
        return Error::Ok;
    }

    // Positive fixint: 0xxxxxxx
    if ((code & 0x80) == 0x00) {
        out = Value(code);
        return Error::Ok;
    }

    if (code < tag::UInt8 || code > tag::Int64) [[unlikely]] {
        unreachable_tag("integer", code);
    }

    // 0xcc-0xcf unsigned, 0xd0-0xd3 signed; low two bits select 1/2/4/8 bytes
    unsigned index = static_cast<unsigned>(code - tag::UInt8);
    std::size_t width = std::size_t{1} << (index & 3U);

    std::uint64_t raw = 0;
    auto status = reader.read_be(width, raw);
    if (status != Error::Ok) {
        return status;
    }

    if (index < 4) {
        out = Value(raw);
        return Error::Ok;
    }

    switch (width) {
    case 1:
        out = Value(static_cast<std::int8_t>(raw));
        break;
    case 2:
        out = Value(static_cast<std::int16_t>(raw));
        break;
    case 4:
        out = Value(static_cast<std::int32_t>(raw));
        break;
    default:
        out = Value(static_cast<std::int64_t>(raw));
        break;
    }
    return Error::Ok;
}

Error unpack_float(std::uint8_t code, ByteReader& reader, Value& out) {
    std::uint64_t raw = 0;

    if (code == tag::Float32) {
        auto status = reader.read_be(4, raw);
        if (status != Error::Ok) {
            return status;
        }
        out = Value(std::bit_cast<float>(static_cast<std::uint32_t>(raw)));
        return Error::Ok;
    }

    if (code == tag::Float64) {
        auto status = reader.read_be(8, raw);
        if (status != Error::Ok) {
            return status;
        }
        out = Value(std::bit_cast<double>(raw));
        return Error::Ok;
    }

    unreachable_tag("float", code);
}

Error unpack_string(std::uint8_t code, ByteReader& reader, const UnpackOptions& options,
                    Value& out) {
    std::size_t length = 0;
    Error status = Error::Ok;

    if ((code & 0xE0) == tag::FixStr) {
        length = code & 0x1FU;
    } else if (code == tag::Str8) {
        status = read_length(reader, 1, length);
    } else if (code == tag::Str16) {
        status = read_length(reader, 2, length);
    } else if (code == tag::Str32) {
        status = read_length(reader, 4, length);
    } else {
        unreachable_tag("string", code);
    }
    if (status != Error::Ok) {
        return status;
    }

    Binary payload;
    status = reader.read_payload(length, payload);
    if (status != Error::Ok) {
        return status;
    }

    if (is_valid_utf8(payload.data(), payload.size())) {
        out = Value(std::string(payload.begin(), payload.end()));
        return Error::Ok;
    }

    if (options.allow_invalid_utf8) {
        out = Value(std::move(payload));
        return Error::Ok;
    }

    return Error::InvalidString;
}

Error unpack_binary(std::uint8_t code, ByteReader& reader, Value& out) {
    std::size_t length = 0;
    Error status = Error::Ok;

    switch (code) {
    case tag::Bin8:
        status = read_length(reader, 1, length);
        break;
    case tag::Bin16:
        status = read_length(reader, 2, length);
        break;
    case tag::Bin32:
        status = read_length(reader, 4, length);
        break;
    default:
        unreachable_tag("binary", code);
    }
    if (status != Error::Ok) {
        return status;
    }

    Binary payload;
    status = reader.read_payload(length, payload);
    if (status != Error::Ok) {
        return status;
    }

    out = Value(std::move(payload));
    return Error::Ok;
}

Error unpack_ext(std::uint8_t code, ByteReader& reader, const UnpackOptions& options,
                 Value& out) {
    std::size_t length = 0;
    Error status = Error::Ok;

    if (code >= tag::FixExt1 && code <= tag::FixExt16) {
        // fixext 1/2/4/8/16
        length = std::size_t{1} << (code - tag::FixExt1);
    } else if (code == tag::Ext8) {
        status = read_length(reader, 1, length);
    } else if (code == tag::Ext16) {
        status = read_length(reader, 2, length);
    } else if (code == tag::Ext32) {
        status = read_length(reader, 4, length);
    } else {
        unreachable_tag("ext", code);
    }
    if (status != Error::Ok) {
        return status;
    }

    std::uint8_t type_byte = 0;
    status = reader.read_u8(type_byte);
    if (status != Error::Ok) {
        return status;
    }

    Ext ext;
    ext.type = static_cast<std::int8_t>(type_byte);
    status = reader.read_payload(length, ext.data);
    if (status != Error::Ok) {
        return status;
    }

    // Per-call handler, then process-wide registry, then the raw object
    auto handler = options.ext_handlers.find(ext.type);
    if (handler != options.ext_handlers.end() && handler->second) {
        out = handler->second(ext);
        return Error::Ok;
    }

    if (const ExtType* entry = ext_registry().find(ext.type)) {
        if (!entry->unpack) {
            return Error::NotImplemented;
        }
        out = entry->unpack(ext.data);
        return Error::Ok;
    }

    out = Value(std::move(ext));
    return Error::Ok;
}

Error unpack_array(std::uint8_t code, ByteReader& reader, const UnpackOptions& options,
                   std::size_t depth, Value& out) {
    std::size_t length = 0;
    Error status = Error::Ok;

    if ((code & 0xF0) == tag::FixArray) {
        length = code & 0x0FU;
    } else if (code == tag::Array16) {
        status = read_length(reader, 2, length);
    } else if (code == tag::Array32) {
        status = read_length(reader, 4, length);
    } else {
        unreachable_tag("array", code);
    }
    if (status != Error::Ok) {
        return status;
    }

    Array array(options.use_tuple);
    array.reserve(std::min(length, MAX_RESERVE));

    for (std::size_t i = 0; i < length; ++i) {
        Value element;
        status = unpack_value(reader, options, depth + 1, element);
        if (status != Error::Ok) {
            return status;
        }
        array.push_back(std::move(element));
    }

    out = Value(std::move(array));
    return Error::Ok;
}

Error unpack_map(std::uint8_t code, ByteReader& reader, const UnpackOptions& options,
                 std::size_t depth, Value& out) {
    std::size_t length = 0;
    Error status = Error::Ok;

    if ((code & 0xF0) == tag::FixMap) {
        length = code & 0x0FU;
    } else if (code == tag::Map16) {
        status = read_length(reader, 2, length);
    } else if (code == tag::Map32) {
        status = read_length(reader, 4, length);
    } else {
        unreachable_tag("map", code);
    }
    if (status != Error::Ok) {
        return status;
    }

    Map map(options.use_ordered_dict);
    map.reserve(std::min(length, MAX_RESERVE));

    for (std::size_t i = 0; i < length; ++i) {
        Value key;
        status = unpack_value(reader, options, depth + 1, key);
        if (status != Error::Ok) {
            return status;
        }

        // Lists become tuples so they can serve as keys
        if (key.is_array()) {
            key = Value(key.as_array().to_tuple());
        }
        if (!key.hashable()) {
            return Error::UnhashableKey;
        }
        if (map.contains(key)) {
            return Error::DuplicateKey;
        }

        Value value;
        status = unpack_value(reader, options, depth + 1, value);
        if (status != Error::Ok) {
            return status;
        }

        status = map.insert(std::move(key), std::move(value));
        if (status != Error::Ok) {
            return status;
        }
    }

    out = Value(std::move(map));
    return Error::Ok;
}

Error unpack_value(ByteReader& reader, const UnpackOptions& options, std::size_t depth,
                   Value& out) {
    std::uint8_t code = 0;
    auto status = reader.read_u8(code);
    if (status != Error::Ok) {
        return status;
    }

    switch (classify(code)) {
    case Kind::Integer:
        return unpack_integer(code, reader, out);
    case Kind::Float:
        return unpack_float(code, reader, out);
    case Kind::Nil:
        out = Value();
        return Error::Ok;
    case Kind::Boolean:
        out = Value(code == tag::True);
        return Error::Ok;
    case Kind::String:
        return unpack_string(code, reader, options, out);
    case Kind::Binary:
        return unpack_binary(code, reader, out);
    case Kind::Array:
        if (depth >= options.max_depth) {
            return Error::DepthExceeded;
        }
        return unpack_array(code, reader, options, depth, out);
    case Kind::Map:
        if (depth >= options.max_depth) {
            return Error::DepthExceeded;
        }
        return unpack_map(code, reader, options, depth, out);
    case Kind::Ext:
        return unpack_ext(code, reader, options, out);
    case Kind::Reserved:
        return Error::ReservedCode;
    }

    unreachable_tag("dispatch", code);
}

} // namespace

Error unpack(ByteReader& reader, const UnpackOptions& options, Value& out) {
    return unpack_value(reader, options, 0, out);
}

} // namespace msgunpack
