/**
 * @file test_ext.cpp
 * @brief Unit tests for extension type resolution.
 */

#include <catch2/catch.hpp>
#include <msgunpack/msgunpack.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace msgunpack;

namespace {

// Clears the process-wide registry around each test
struct RegistryGuard {
    RegistryGuard() { ext_registry().clear(); }
    ~RegistryGuard() { ext_registry().clear(); }
    RegistryGuard(const RegistryGuard&) = delete;
    RegistryGuard& operator=(const RegistryGuard&) = delete;
};

Value decode_ok(const std::vector<std::uint8_t>& bytes, const UnpackOptions& options = {}) {
    Value out;
    REQUIRE(unpackb(bytes.data(), bytes.size(), out, options) == Error::Ok);
    return out;
}

Error decode_error(const std::vector<std::uint8_t>& bytes, const UnpackOptions& options = {}) {
    Value out;
    return unpackb(bytes.data(), bytes.size(), out, options);
}

// Interprets a 4-byte payload as a big-endian unsigned counter
Value decode_counter(const Binary& data) {
    std::uint64_t v = 0;
    for (auto byte : data) {
        v = (v << 8) | byte;
    }
    return Value(v);
}

} // namespace

TEST_CASE("ExtRegistry table operations", "[ext][registry]") {
    RegistryGuard guard;
    ExtRegistry& registry = ext_registry();

    REQUIRE(registry.size() == 0);
    REQUIRE(registry.find(1) == nullptr);

    registry.register_type(1, ExtType{"counter", decode_counter});
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find(1) != nullptr);
    REQUIRE(registry.find(1)->name == "counter");

    SECTION("re-registering replaces the entry") {
        registry.register_type(1, ExtType{"other", nullptr});
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.find(1)->name == "other");
    }

    SECTION("unregister") {
        REQUIRE(registry.unregister_type(1));
        REQUIRE_FALSE(registry.unregister_type(1));
        REQUIRE(registry.find(1) == nullptr);
    }

    SECTION("same instance every call") {
        REQUIRE(&ext_registry() == &registry);
    }
}

TEST_CASE("Registered ext types decode through the registry", "[ext][registry]") {
    RegistryGuard guard;
    ext_registry().register_type(7, ExtType{"counter", decode_counter});

    REQUIRE(decode_ok({0xD6, 0x07, 0x00, 0x00, 0x01, 0x00}) == Value(256));

    SECTION("unregistered types stay raw") {
        REQUIRE(decode_ok({0xD4, 0x08, 0x2A}) == Value(Ext{8, {0x2A}}));
    }

    SECTION("registry applies to ext 8 as well as fixext") {
        REQUIRE(decode_ok({0xC7, 0x02, 0x07, 0x01, 0x00}) == Value(256));
    }

    SECTION("negative type identifiers") {
        ext_registry().register_type(-1, ExtType{"neg", decode_counter});
        REQUIRE(decode_ok({0xD4, 0xFF, 0x09}) == Value(9));
    }
}

TEST_CASE("Registered type without decoder", "[ext][registry]") {
    RegistryGuard guard;
    ext_registry().register_type(3, ExtType{"encode-only", nullptr});

    REQUIRE(decode_error({0xD4, 0x03, 0x00}) == Error::NotImplemented);

    std::vector<std::uint8_t> bytes{0x91, 0xD4, 0x03, 0x00};
    REQUIRE_THROWS_AS(unpackb(bytes), NotImplementedException);
}

TEST_CASE("Per-call handlers take precedence over the registry", "[ext][registry]") {
    RegistryGuard guard;
    ext_registry().register_type(7, ExtType{"counter", decode_counter});

    UnpackOptions options;
    options.ext_handlers[7] = [](const Ext&) { return Value("handler"); };

    REQUIRE(decode_ok({0xD4, 0x07, 0x00}, options) == Value("handler"));

    SECTION("handler shadows a registry entry without decoder") {
        ext_registry().register_type(3, ExtType{"encode-only", nullptr});
        options.ext_handlers[3] = [](const Ext& ext) { return Value(ext.data); };
        REQUIRE(decode_ok({0xD4, 0x03, 0x11}, options) == Value(Binary{0x11}));
    }

    SECTION("empty handler falls through to the registry") {
        options.ext_handlers[7] = nullptr;
        REQUIRE(decode_ok({0xD4, 0x07, 0x05}, options) == Value(5));
    }
}

TEST_CASE("Handler receives the full ext object", "[ext]") {
    std::int8_t seen_type = 0;
    Binary seen_data;

    UnpackOptions options;
    options.ext_handlers[-5] = [&](const Ext& ext) {
        seen_type = ext.type;
        seen_data = ext.data;
        return Value(Nil{});
    };

    REQUIRE(decode_ok({0xC7, 0x03, 0xFB, 0x0A, 0x0B, 0x0C}, options).is_nil());
    REQUIRE(seen_type == -5);
    REQUIRE(seen_data == Binary{0x0A, 0x0B, 0x0C});
}

TEST_CASE("Handler exceptions propagate to the caller", "[ext]") {
    UnpackOptions options;
    options.ext_handlers[1] = [](const Ext&) -> Value { throw std::runtime_error("bad ext"); };

    std::vector<std::uint8_t> bytes{0x92, 0x01, 0xD4, 0x01, 0x00};
    Value out;
    REQUIRE_THROWS_AS(unpackb(bytes.data(), bytes.size(), out, options), std::runtime_error);
}

TEST_CASE("Handler results used as map keys", "[ext]") {
    UnpackOptions options;

    SECTION("hashable result") {
        options.ext_handlers[1] = [](const Ext& ext) { return Value(static_cast<int>(ext.data[0])); };
        Value value = decode_ok({0x81, 0xD4, 0x01, 0x09, 0xC3}, options);
        REQUIRE(value.as_map().at(9) == Value(true));
    }

    SECTION("unhashable result") {
        options.ext_handlers[1] = [](const Ext&) { return Value(Map()); };
        REQUIRE(decode_error({0x81, 0xD4, 0x01, 0x00, 0xC0}, options) == Error::UnhashableKey);
    }

    SECTION("list result is converted to a tuple key") {
        options.ext_handlers[1] = [](const Ext&) {
            return Value(Array(std::vector<Value>{1, 2}));
        };
        Value value = decode_ok({0x81, 0xD4, 0x01, 0x00, 0xC0}, options);
        REQUIRE(value.as_map().begin()->first.as_array().is_tuple());
    }
}
