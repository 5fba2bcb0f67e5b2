/**
 * @file test_edge_cases.cpp
 * @brief Boundary conditions: truncation, nesting limits, hostile lengths.
 */

#include <catch2/catch.hpp>
#include <msgunpack/msgunpack.hpp>

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

using namespace msgunpack;

namespace {

Error decode(const std::vector<std::uint8_t>& bytes, Value& out,
             const UnpackOptions& options = {}) {
    return unpackb(bytes.data(), bytes.size(), out, options);
}

Error decode_error(const std::vector<std::uint8_t>& bytes, const UnpackOptions& options = {}) {
    Value out;
    return decode(bytes, out, options);
}

std::vector<std::uint8_t> nested_arrays(std::size_t levels) {
    std::vector<std::uint8_t> bytes(levels, 0x91);
    bytes.push_back(0xC0);
    return bytes;
}

// Hands out at most one byte per read
class TrickleSource final : public Source {
public:
    explicit TrickleSource(const std::vector<std::uint8_t>& data) : data_(data) {}

    std::size_t read(std::uint8_t* dst, std::size_t n) override {
        if (n == 0 || pos_ >= data_.size()) {
            return 0;
        }
        dst[0] = data_[pos_++];
        return 1;
    }

private:
    const std::vector<std::uint8_t>& data_;
    std::size_t pos_ = 0;
};

std::vector<std::uint8_t> sample_document() {
    Map map(true);
    REQUIRE(map.insert("name", "d\xC3\xA9j\xC3\xA0 vu") == Error::Ok);
    REQUIRE(map.insert("values", Value(Array(std::vector<Value>{1, -200, 70000, 1.25}))) ==
            Error::Ok);
    REQUIRE(map.insert(Value(Array(std::vector<Value>{1, 2}, true)), Value(Binary{0xDE, 0xAD})) ==
            Error::Ok);
    REQUIRE(map.insert(-1, Value(Ext{9, {1, 2, 3}})) == Error::Ok);
    REQUIRE(map.insert("long", std::string(40, 'q')) == Error::Ok);
    return packb(Value(map));
}

} // namespace

TEST_CASE("Every strict prefix is insufficient data", "[edge][truncation]") {
    auto document = sample_document();

    Value full;
    REQUIRE(decode(document, full) == Error::Ok);

    for (std::size_t length = 0; length < document.size(); ++length) {
        INFO("prefix length " << length);
        std::vector<std::uint8_t> prefix(document.begin(),
                                         document.begin() + static_cast<std::ptrdiff_t>(length));
        REQUIRE(decode_error(prefix) == Error::InsufficientData);
    }
}

TEST_CASE("Every single-byte input", "[edge]") {
    for (int byte = 0; byte <= 0xFF; ++byte) {
        INFO("byte " << byte);
        auto code = static_cast<std::uint8_t>(byte);
        Error result = decode_error({code});

        bool complete = code <= 0x7F || code == 0x80 || code == 0x90 || code == 0xA0 ||
                        code == 0xC0 || code == 0xC2 || code == 0xC3 || code >= 0xE0;

        if (code == 0xC1) {
            REQUIRE(result == Error::ReservedCode);
        } else if (complete) {
            REQUIRE(result == Error::Ok);
        } else {
            REQUIRE(result == Error::InsufficientData);
        }
    }
}

TEST_CASE("Nesting depth limit", "[edge][depth]") {
    SECTION("default limit accepts moderate nesting") {
        Value out;
        REQUIRE(decode(nested_arrays(100), out) == Error::Ok);
    }

    SECTION("default limit rejects deep nesting") {
        REQUIRE(decode_error(nested_arrays(600)) == Error::DepthExceeded);
    }

    SECTION("limit of zero rejects any container") {
        UnpackOptions options;
        options.max_depth = 0;
        REQUIRE(decode_error({0x90}, options) == Error::DepthExceeded);
        REQUIRE(decode_error({0x80}, options) == Error::DepthExceeded);

        Value out;
        REQUIRE(decode({0x01}, out, options) == Error::Ok);
    }

    SECTION("limit counts arrays and maps alike") {
        UnpackOptions options;
        options.max_depth = 2;

        Value out;
        REQUIRE(decode({0x91, 0x90}, out, options) == Error::Ok);
        REQUIRE(decode({0x81, 0x01, 0x80}, out, options) == Error::Ok);
        REQUIRE(decode_error({0x91, 0x91, 0x90}, options) == Error::DepthExceeded);
        REQUIRE(decode_error({0x81, 0x01, 0x91, 0x80}, options) == Error::DepthExceeded);
    }

    SECTION("throwing API") {
        auto bytes = nested_arrays(600);
        REQUIRE_THROWS_AS(unpackb(bytes), DepthExceededException);
    }
}

TEST_CASE("Declared lengths larger than the input", "[edge][length]") {
    REQUIRE(decode_error({0xDB, 0xFF, 0xFF, 0xFF, 0xFF, 'a'}) == Error::InsufficientData);
    REQUIRE(decode_error({0xC6, 0xFF, 0xFF, 0xFF, 0xFF, 0x00}) == Error::InsufficientData);
    REQUIRE(decode_error({0xC9, 0xFF, 0xFF, 0xFF, 0xFF, 0x01}) == Error::InsufficientData);
    REQUIRE(decode_error({0xDD, 0xFF, 0xFF, 0xFF, 0xFF, 0x01}) == Error::InsufficientData);
    REQUIRE(decode_error({0xDF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01, 0x02}) == Error::InsufficientData);
}

TEST_CASE("Payloads spanning several read chunks", "[edge][length]") {
    std::size_t size = READ_CHUNK_BYTES * 2 + 17;
    std::vector<std::uint8_t> bytes{0xC6};
    bytes.push_back(static_cast<std::uint8_t>(size >> 24));
    bytes.push_back(static_cast<std::uint8_t>(size >> 16));
    bytes.push_back(static_cast<std::uint8_t>(size >> 8));
    bytes.push_back(static_cast<std::uint8_t>(size));
    for (std::size_t i = 0; i < size; ++i) {
        bytes.push_back(static_cast<std::uint8_t>(i));
    }

    Value out;
    REQUIRE(decode(bytes, out) == Error::Ok);
    const Binary& data = out.as_binary();
    REQUIRE(data.size() == size);
    REQUIRE(data[READ_CHUNK_BYTES] == static_cast<std::uint8_t>(READ_CHUNK_BYTES));
    REQUIRE(data.back() == static_cast<std::uint8_t>(size - 1));

    bytes.pop_back();
    REQUIRE(decode_error(bytes) == Error::InsufficientData);
}

TEST_CASE("Decoding from a source that returns one byte at a time", "[edge][source]") {
    auto document = sample_document();

    Value expected;
    REQUIRE(decode(document, expected) == Error::Ok);

    TrickleSource source(document);
    ByteReader reader(source);
    Value actual;
    REQUIRE(unpack(reader, UnpackOptions{}, actual) == Error::Ok);
    REQUIRE(actual == expected);
    REQUIRE(reader.position() == document.size());
}

TEST_CASE("Map key identity", "[edge][map]") {
    SECTION("integer width does not distinguish keys") {
        REQUIRE(decode_error({0x82, 0x05, 0xC0, 0xCD, 0x00, 0x05, 0xC0}) == Error::DuplicateKey);
        REQUIRE(decode_error({0x82, 0xFF, 0xC0, 0xD1, 0xFF, 0xFF, 0xC0}) == Error::DuplicateKey);
    }

    SECTION("integer and float with the same value collide") {
        // {1: nil, 1.0: nil}
        REQUIRE(decode_error({0x82, 0x01, 0xC0, 0xCB, 0x3F, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00,
                              0x00, 0xC0}) == Error::DuplicateKey);
        // {0.0: nil, 0: nil} with a float 32 key
        REQUIRE(decode_error({0x82, 0xCA, 0x00, 0x00, 0x00, 0x00, 0xC0, 0x00, 0xC0}) ==
                Error::DuplicateKey);
    }

    SECTION("booleans collide with 0 and 1") {
        // {true: nil, 1: nil}
        REQUIRE(decode_error({0x82, 0xC3, 0xC0, 0x01, 0xC0}) == Error::DuplicateKey);
        // {0: nil, false: nil}
        REQUIRE(decode_error({0x82, 0x00, 0xC0, 0xC2, 0xC0}) == Error::DuplicateKey);
    }

    SECTION("tuple keys compare elements by value") {
        // {(1,): nil, (1.0,): nil}
        REQUIRE(decode_error({0x82, 0x91, 0x01, 0xC0, 0x91, 0xCB, 0x3F, 0xF0, 0x00, 0x00, 0x00,
                              0x00, 0x00, 0x00, 0xC0}) == Error::DuplicateKey);
    }

    SECTION("distinct numbers stay distinct") {
        // {1: nil, 1.5: nil, true: ...} fails only on the third key
        Value out;
        REQUIRE(decode({0x82, 0x01, 0xC0, 0xCB, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                        0xC0},
                       out) == Error::Ok);
        REQUIRE(out.as_map().size() == 2);
        REQUIRE(decode_error({0x83, 0x01, 0xC0, 0xCB, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00,
                              0x00, 0xC0, 0xC3, 0xC0}) == Error::DuplicateKey);
    }

    SECTION("string and binary keys stay distinct") {
        Value out;
        REQUIRE(decode({0x82, 0xA1, 0x61, 0x01, 0xC4, 0x01, 0x61, 0x02}, out) == Error::Ok);
        REQUIRE(out.as_map().at("a") == Value(1));
        REQUIRE(out.as_map().at(Binary{'a'}) == Value(2));
    }

    SECTION("tuple keys with equal elements collide") {
        UnpackOptions options;
        options.use_tuple = true;
        REQUIRE(decode_error({0x82, 0x91, 0x01, 0xC0, 0x91, 0x01, 0xC0}, options) ==
                Error::DuplicateKey);
    }

    SECTION("duplicate check precedes the value") {
        // Second value is truncated, the repeated key is reported first
        REQUIRE(decode_error({0x82, 0x01, 0xC0, 0x01, 0x92}) == Error::DuplicateKey);
    }

    SECTION("invalid UTF-8 keys become binary keys when allowed") {
        UnpackOptions options;
        options.allow_invalid_utf8 = true;
        Value out;
        REQUIRE(decode({0x81, 0xA1, 0xFF, 0xC3}, out, options) == Error::Ok);
        REQUIRE(out.as_map().at(Binary{0xFF}) == Value(true));
    }
}

TEST_CASE("Errors inside containers abort the whole decode", "[edge]") {
    REQUIRE(decode_error({0x92, 0x01, 0xC1}) == Error::ReservedCode);
    REQUIRE(decode_error({0x91, 0x81, 0xA1, 0xFF, 0x01}) == Error::InvalidString);
    REQUIRE(decode_error({0x91, 0x91, 0x91, 0x82, 0x01, 0x01, 0x01, 0x01}) ==
            Error::DuplicateKey);
}
