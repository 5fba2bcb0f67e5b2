/**
 * @file tag.hpp
 * @brief MessagePack tag byte codes and classification.
 *
 * The first byte of every encoded value selects its category. Fixed-width
 * codes, length-prefixed codes and values packed into the tag itself
 * interleave in the same 0x00-0xff range:
 *
 * | Range     | Meaning                         |
 * |-----------|---------------------------------|
 * | 0x00-0x7f | positive fixint                 |
 * | 0x80-0x8f | fixmap (low nibble = size)      |
 * | 0x90-0x9f | fixarray (low nibble = size)    |
 * | 0xa0-0xbf | fixstr (low 5 bits = length)    |
 * | 0xc0      | nil                             |
 * | 0xc1      | reserved                        |
 * | 0xc2/0xc3 | false/true                      |
 * | 0xc4-0xc6 | bin 8/16/32                     |
 * | 0xc7-0xc9 | ext 8/16/32                     |
 * | 0xca/0xcb | float 32/64                     |
 * | 0xcc-0xcf | uint 8/16/32/64                 |
 * | 0xd0-0xd3 | int 8/16/32/64                  |
 * | 0xd4-0xd8 | fixext 1/2/4/8/16               |
 * | 0xd9-0xdb | str 8/16/32                     |
 * | 0xdc/0xdd | array 16/32                     |
 * | 0xde/0xdf | map 16/32                       |
 * | 0xe0-0xff | negative fixint                 |
 */

#ifndef MSGUNPACK_TAG_HPP
#define MSGUNPACK_TAG_HPP

#include <cstdint>

namespace msgunpack {

namespace tag {

enum Code : std::uint8_t {
    PositiveFixInt = 0x00,
    FixMap = 0x80,
    FixArray = 0x90,
    FixStr = 0xA0,

    Nil = 0xC0,
    Reserved = 0xC1,
    False = 0xC2,
    True = 0xC3,

    Bin8 = 0xC4,
    Bin16 = 0xC5,
    Bin32 = 0xC6,

    Ext8 = 0xC7,
    Ext16 = 0xC8,
    Ext32 = 0xC9,

    Float32 = 0xCA,
    Float64 = 0xCB,

    UInt8 = 0xCC,
    UInt16 = 0xCD,
    UInt32 = 0xCE,
    UInt64 = 0xCF,

    Int8 = 0xD0,
    Int16 = 0xD1,
    Int32 = 0xD2,
    Int64 = 0xD3,

    FixExt1 = 0xD4,
    FixExt2 = 0xD5,
    FixExt4 = 0xD6,
    FixExt8 = 0xD7,
    FixExt16 = 0xD8,

    Str8 = 0xD9,
    Str16 = 0xDA,
    Str32 = 0xDB,

    Array16 = 0xDC,
    Array32 = 0xDD,

    Map16 = 0xDE,
    Map32 = 0xDF,

    NegativeFixInt = 0xE0
};

} // namespace tag

/**
 * @brief Decode routine selected by a tag byte.
 */
enum class Kind : std::uint8_t {
    Integer,
    Float,
    Nil,
    Boolean,
    String,
    Binary,
    Array,
    Map,
    Ext,
    Reserved
};

/**
 * @brief Classify a tag byte.
 *
 * Total over all 256 byte values. Only 0xc1 yields Kind::Reserved.
 *
 * @param code First byte of an encoded value
 * @return Category of the value
 */
constexpr Kind classify(std::uint8_t code) noexcept {
    if (code <= 0x7F || code >= tag::NegativeFixInt) {
        return Kind::Integer;
    }
    if (code <= 0x8F) {
        return Kind::Map;
    }
    if (code <= 0x9F) {
        return Kind::Array;
    }
    if (code <= 0xBF) {
        return Kind::String;
    }

    switch (code) {
    case tag::Nil:
        return Kind::Nil;
    case tag::Reserved:
        return Kind::Reserved;
    case tag::False:
    case tag::True:
        return Kind::Boolean;
    case tag::Bin8:
    case tag::Bin16:
    case tag::Bin32:
        return Kind::Binary;
    case tag::Ext8:
    case tag::Ext16:
    case tag::Ext32:
    case tag::FixExt1:
    case tag::FixExt2:
    case tag::FixExt4:
    case tag::FixExt8:
    case tag::FixExt16:
        return Kind::Ext;
    case tag::Float32:
    case tag::Float64:
        return Kind::Float;
    case tag::UInt8:
    case tag::UInt16:
    case tag::UInt32:
    case tag::UInt64:
    case tag::Int8:
    case tag::Int16:
    case tag::Int32:
    case tag::Int64:
        return Kind::Integer;
    case tag::Str8:
    case tag::Str16:
    case tag::Str32:
        return Kind::String;
    case tag::Array16:
    case tag::Array32:
        return Kind::Array;
    default:
        // Only Map16 and Map32 remain in 0xc0-0xdf
        return Kind::Map;
    }
}

/**
 * @brief Name of a tag category, for diagnostics.
 */
constexpr const char* kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::Integer:
        return "integer";
    case Kind::Float:
        return "float";
    case Kind::Nil:
        return "nil";
    case Kind::Boolean:
        return "boolean";
    case Kind::String:
        return "string";
    case Kind::Binary:
        return "binary";
    case Kind::Array:
        return "array";
    case Kind::Map:
        return "map";
    case Kind::Ext:
        return "ext";
    case Kind::Reserved:
        return "reserved";
    }
    return "unknown";
}

static_assert(classify(0xC1) == Kind::Reserved);
static_assert(classify(0xDE) == Kind::Map && classify(0xDF) == Kind::Map);

} // namespace msgunpack

#endif // MSGUNPACK_TAG_HPP
