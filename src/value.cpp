/**
 * @file value.cpp
 * @brief Value, Array and Map implementation.
 */

#include <msgunpack/value.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <limits>
#include <stdexcept>

namespace msgunpack {

namespace detail {

inline void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2);
}

inline std::size_t hash_bytes(const std::uint8_t* data, std::size_t size) noexcept {
    // FNV-1a
    std::uint64_t h = 0xCBF29CE484222325ULL;
    for (std::size_t i = 0; i < size; ++i) {
        h ^= data[i];
        h *= 0x100000001B3ULL;
    }
    return static_cast<std::size_t>(h);
}

[[noreturn]] void out_of_range(const char* what) {
#if MSGUNPACK_NO_EXCEPTIONS
    std::fprintf(stderr, "%s\n", what);
    std::abort();
#else
    throw std::out_of_range(what);
#endif
}

} // namespace detail

// ============================================================================
// Array
// ============================================================================

Array::Array(std::vector<Value> items, bool tuple) : items_(std::move(items)), tuple_(tuple) {}

const Value& Array::operator[](std::size_t index) const {
    return items_[index];
}

const Value& Array::at(std::size_t index) const {
    return items_.at(index);
}

void Array::reserve(std::size_t count) {
    items_.reserve(count);
}

void Array::push_back(Value value) {
    items_.push_back(std::move(value));
}

Array::const_iterator Array::begin() const noexcept {
    return items_.begin();
}

Array::const_iterator Array::end() const noexcept {
    return items_.end();
}

Array Array::to_tuple() const {
    Array result(true);
    result.items_.reserve(items_.size());
    for (const auto& item : items_) {
        if (item.is_array()) {
            result.items_.emplace_back(item.as_array().to_tuple());
        } else {
            result.items_.push_back(item);
        }
    }
    return result;
}

// ============================================================================
// Map
// ============================================================================

Error Map::insert(Value key, Value value) {
    if (!key.hashable()) {
        return Error::UnhashableKey;
    }
    if (find_entry(key) != nullptr) {
        return Error::DuplicateKey;
    }

    index_.emplace(key_hash(key), entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
    return Error::Ok;
}

const Map::Entry* Map::find_entry(const Value& key) const {
    if (!key.hashable()) {
        return nullptr;
    }

    auto range = index_.equal_range(key_hash(key));
    for (auto it = range.first; it != range.second; ++it) {
        const Entry& entry = entries_[it->second];
        if (key_equal(entry.first, key)) {
            return &entry;
        }
    }
    return nullptr;
}

const Value* Map::find(const Value& key) const {
    const Entry* entry = find_entry(key);
    return entry == nullptr ? nullptr : &entry->second;
}

bool Map::contains(const Value& key) const {
    return find(key) != nullptr;
}

const Value& Map::at(const Value& key) const {
    const Value* value = find(key);
    if (value == nullptr) {
        detail::out_of_range("msgunpack::Map::at: key not found");
    }
    return *value;
}

void Map::reserve(std::size_t count) {
    entries_.reserve(count);
    index_.reserve(count);
}

Map::const_iterator Map::begin() const noexcept {
    return entries_.begin();
}

Map::const_iterator Map::end() const noexcept {
    return entries_.end();
}

// ============================================================================
// Value
// ============================================================================

Value::Type Value::type() const noexcept {
    switch (storage_.index()) {
    case 0:
        return Type::Nil;
    case 1:
        return Type::Boolean;
    case 2:
    case 3:
        return Type::Integer;
    case 4:
        return Type::Float;
    case 5:
        return Type::String;
    case 6:
        return Type::Binary;
    case 7:
        return Type::Array;
    case 8:
        return Type::Map;
    default:
        return Type::Ext;
    }
}

std::int64_t Value::as_int64() const {
    if (const auto* negative = std::get_if<std::int64_t>(&storage_)) {
        return *negative;
    }
    std::uint64_t v = std::get<std::uint64_t>(storage_);
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        detail::out_of_range("msgunpack::Value::as_int64: value exceeds int64 range");
    }
    return static_cast<std::int64_t>(v);
}

std::uint64_t Value::as_uint64() const {
    if (std::holds_alternative<std::int64_t>(storage_)) {
        detail::out_of_range("msgunpack::Value::as_uint64: value is negative");
    }
    return std::get<std::uint64_t>(storage_);
}

bool Value::hashable() const noexcept {
    if (const auto* array = std::get_if<Array>(&storage_)) {
        if (!array->is_tuple()) {
            return false;
        }
        for (const auto& item : *array) {
            if (!item.hashable()) {
                return false;
            }
        }
        return true;
    }
    return !std::holds_alternative<Map>(storage_);
}

std::size_t Value::hash() const noexcept {
    std::size_t seed = storage_.index();

    switch (type()) {
    case Type::Nil:
        break;
    case Type::Boolean:
        detail::hash_combine(seed, std::hash<bool>{}(std::get<bool>(storage_)));
        break;
    case Type::Integer:
        if (is_negative()) {
            detail::hash_combine(seed, std::hash<std::int64_t>{}(std::get<std::int64_t>(storage_)));
        } else {
            detail::hash_combine(seed,
                                 std::hash<std::uint64_t>{}(std::get<std::uint64_t>(storage_)));
        }
        break;
    case Type::Float:
        detail::hash_combine(seed, std::hash<double>{}(std::get<double>(storage_)));
        break;
    case Type::String:
        detail::hash_combine(seed, std::hash<std::string>{}(std::get<std::string>(storage_)));
        break;
    case Type::Binary: {
        const Binary& bin = std::get<Binary>(storage_);
        detail::hash_combine(seed, detail::hash_bytes(bin.data(), bin.size()));
        break;
    }
    case Type::Array:
        for (const auto& item : std::get<Array>(storage_)) {
            detail::hash_combine(seed, item.hash());
        }
        break;
    case Type::Map:
        // Unhashable; keep the size so the result is at least deterministic
        detail::hash_combine(seed, std::get<Map>(storage_).size());
        break;
    case Type::Ext: {
        const Ext& ext = std::get<Ext>(storage_);
        detail::hash_combine(seed, std::hash<int>{}(ext.type));
        detail::hash_combine(seed, detail::hash_bytes(ext.data.data(), ext.data.size()));
        break;
    }
    }

    return seed;
}

namespace {

bool maps_equal(const Map& lhs, const Map& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    if (lhs.ordered() && rhs.ordered()) {
        auto it = rhs.begin();
        for (const auto& entry : lhs) {
            if (!(entry.first == it->first) || !(entry.second == it->second)) {
                return false;
            }
            ++it;
        }
        return true;
    }

    for (const auto& entry : lhs) {
        const Map::Entry* other = rhs.find_entry(entry.first);
        if (other == nullptr || !(other->first == entry.first) ||
            !(other->second == entry.second)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Integer view of a numeric key.
 *
 * Booleans give 0 or 1; floats qualify only when finite, integral and
 * within the int64/uint64 range. Negative values are returned as their
 * two's complement bits.
 *
 * @return true if the value has an integer view
 */
bool integral_key(const Value& value, bool& negative, std::uint64_t& bits) {
    switch (value.type()) {
    case Value::Type::Boolean:
        negative = false;
        bits = value.as_bool() ? 1U : 0U;
        return true;
    case Value::Type::Integer:
        negative = value.is_negative();
        bits = negative ? static_cast<std::uint64_t>(value.as_int64()) : value.as_uint64();
        return true;
    case Value::Type::Float: {
        double d = value.as_double();
        if (!std::isfinite(d) || std::trunc(d) != d) {
            return false;
        }
        if (d < 0.0) {
            // -2^63 is the smallest int64
            if (d < -9223372036854775808.0) {
                return false;
            }
            negative = true;
            bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(d));
            return true;
        }
        // 2^64 is one past the largest uint64
        if (d >= 18446744073709551616.0) {
            return false;
        }
        negative = false;
        bits = static_cast<std::uint64_t>(d);
        return true;
    }
    default:
        return false;
    }
}

} // namespace

bool key_equal(const Value& lhs, const Value& rhs) {
    bool lhs_negative = false;
    bool rhs_negative = false;
    std::uint64_t lhs_bits = 0;
    std::uint64_t rhs_bits = 0;
    bool lhs_integral = integral_key(lhs, lhs_negative, lhs_bits);
    bool rhs_integral = integral_key(rhs, rhs_negative, rhs_bits);

    if (lhs_integral || rhs_integral) {
        return lhs_integral && rhs_integral && lhs_negative == rhs_negative &&
               lhs_bits == rhs_bits;
    }

    if (lhs.is_array() && rhs.is_array()) {
        const Array& a = lhs.as_array();
        const Array& b = rhs.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!key_equal(a[i], b[i])) {
                return false;
            }
        }
        return true;
    }

    return lhs == rhs;
}

std::size_t key_hash(const Value& key) {
    bool negative = false;
    std::uint64_t bits = 0;
    if (integral_key(key, negative, bits)) {
        std::size_t seed = static_cast<std::size_t>(Value::Type::Integer);
        detail::hash_combine(seed, std::hash<std::uint64_t>{}(bits));
        detail::hash_combine(seed, negative ? 1U : 0U);
        return seed;
    }

    if (key.is_array()) {
        std::size_t seed = static_cast<std::size_t>(Value::Type::Array);
        for (const auto& item : key.as_array()) {
            detail::hash_combine(seed, key_hash(item));
        }
        return seed;
    }

    return key.hash();
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.storage_.index() != rhs.storage_.index()) {
        return false;
    }

    switch (lhs.type()) {
    case Value::Type::Nil:
        return true;
    case Value::Type::Boolean:
        return lhs.as_bool() == rhs.as_bool();
    case Value::Type::Integer:
        // Same alternative index, so both share a sign
        if (lhs.is_negative()) {
            return lhs.as_int64() == rhs.as_int64();
        }
        return lhs.as_uint64() == rhs.as_uint64();
    case Value::Type::Float:
        return lhs.as_double() == rhs.as_double();
    case Value::Type::String:
        return lhs.as_string() == rhs.as_string();
    case Value::Type::Binary:
        return lhs.as_binary() == rhs.as_binary();
    case Value::Type::Array:
        return lhs.as_array().items() == rhs.as_array().items();
    case Value::Type::Map:
        return maps_equal(lhs.as_map(), rhs.as_map());
    case Value::Type::Ext:
        return lhs.as_ext() == rhs.as_ext();
    }
    return false;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

// Shortest %g form that reads back to the same double, always marked as a float
void append_float(std::string& out, double d) {
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (!std::isfinite(d) || std::strtod(buf, nullptr) == d) {
            break;
        }
    }
    out += buf;
    if (std::strpbrk(buf, ".ein") == nullptr) {
        out += ".0";
    }
}

void append_bytes_literal(std::string& out, const Binary& bytes) {
    char buf[8];
    out += "b\"";
    for (std::uint8_t byte : bytes) {
        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(byte));
        out += buf;
    }
    out += '"';
}

void append_string_literal(std::string& out, const std::string& s) {
    char buf[8];
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(c) & 0xFFU);
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

void render(std::string& out, const Value& value) {
    char buf[32];

    switch (value.type()) {
    case Value::Type::Nil:
        out += "nil";
        break;
    case Value::Type::Boolean:
        out += value.as_bool() ? "true" : "false";
        break;
    case Value::Type::Integer:
        if (value.is_negative()) {
            std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(value.as_int64()));
        } else {
            std::snprintf(buf, sizeof(buf), "%llu",
                          static_cast<unsigned long long>(value.as_uint64()));
        }
        out += buf;
        break;
    case Value::Type::Float:
        append_float(out, value.as_double());
        break;
    case Value::Type::String:
        append_string_literal(out, value.as_string());
        break;
    case Value::Type::Binary:
        append_bytes_literal(out, value.as_binary());
        break;
    case Value::Type::Array: {
        const Array& array = value.as_array();
        out += array.is_tuple() ? '(' : '[';
        bool first = true;
        for (const auto& item : array) {
            if (!first) {
                out += ", ";
            }
            first = false;
            render(out, item);
        }
        // Single-element tuples keep the trailing comma
        if (array.is_tuple() && array.size() == 1) {
            out += ',';
        }
        out += array.is_tuple() ? ')' : ']';
        break;
    }
    case Value::Type::Map: {
        out += '{';
        bool first = true;
        for (const auto& entry : value.as_map()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            render(out, entry.first);
            out += ": ";
            render(out, entry.second);
        }
        out += '}';
        break;
    }
    case Value::Type::Ext: {
        const Ext& ext = value.as_ext();
        std::snprintf(buf, sizeof(buf), "Ext(%d, ", static_cast<int>(ext.type));
        out += buf;
        append_bytes_literal(out, ext.data);
        out += ')';
        break;
    }
    }
}

} // namespace

std::string to_string(const Value& value) {
    std::string out;
    render(out, value);
    return out;
}

// ============================================================================
// UTF-8 validation
// ============================================================================

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t i = 0;

    while (i < size) {
        std::uint8_t b0 = data[i];

        // ASCII fast path
        if (b0 < 0x80) [[likely]] {
            ++i;
            continue;
        }

        std::size_t need = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;

        if (b0 >= 0xC2 && b0 <= 0xDF) {
            need = 1;
        } else if (b0 == 0xE0) {
            need = 2;
            lo = 0xA0; // no overlong 3-byte forms
        } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
            need = 2;
        } else if (b0 == 0xED) {
            need = 2;
            hi = 0x9F; // no UTF-16 surrogates
        } else if (b0 == 0xF0) {
            need = 3;
            lo = 0x90; // no overlong 4-byte forms
        } else if (b0 >= 0xF1 && b0 <= 0xF3) {
            need = 3;
        } else if (b0 == 0xF4) {
            need = 3;
            hi = 0x8F; // nothing above U+10FFFF
        } else {
            return false;
        }

        if (size - i <= need) {
            return false;
        }

        // Only the first continuation byte has a narrowed range
        std::uint8_t b1 = data[i + 1];
        if (b1 < lo || b1 > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= need; ++k) {
            std::uint8_t bk = data[i + k];
            if (bk < 0x80 || bk > 0xBF) {
                return false;
            }
        }

        i += need + 1;
    }

    return true;
}

} // namespace msgunpack
