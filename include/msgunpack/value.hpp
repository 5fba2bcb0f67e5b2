/**
 * @file value.hpp
 * @brief Decoded MessagePack values.
 *
 * A Value is a tagged union over nil, boolean, integer, float, string,
 * binary, array, map and extension object. Arrays and maps are
 * heterogeneous and nest to any depth.
 */

#ifndef MSGUNPACK_VALUE_HPP
#define MSGUNPACK_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace msgunpack {

class Value;

/**
 * @brief The nil value.
 */
struct Nil {
    friend bool operator==(const Nil&, const Nil&) noexcept = default;
};

/// Raw byte payload
using Binary = std::vector<std::uint8_t>;

/**
 * @brief Extension object: signed 8-bit type identifier plus payload.
 */
struct Ext {
    std::int8_t type = 0;
    Binary data;

    friend bool operator==(const Ext&, const Ext&) = default;
};

/**
 * @brief Ordered sequence of values.
 *
 * An array is either a list or a tuple. Tuples are the hashable form and
 * may serve as map keys. Equality ignores the distinction.
 */
class Array {
public:
    using const_iterator = std::vector<Value>::const_iterator;

    Array() = default;
    explicit Array(bool tuple) noexcept : tuple_(tuple) {}
    Array(std::vector<Value> items, bool tuple = false);

    [[nodiscard]] bool is_tuple() const noexcept { return tuple_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    const Value& operator[](std::size_t index) const;
    const Value& at(std::size_t index) const;

    void reserve(std::size_t count);
    void push_back(Value value);

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    const std::vector<Value>& items() const noexcept { return items_; }

    /**
     * @brief Copy of this array with every nested list turned into a tuple.
     */
    [[nodiscard]] Array to_tuple() const;

private:
    std::vector<Value> items_;
    bool tuple_ = false;
};

/**
 * @brief Mapping between values.
 *
 * Entries are stored in insertion order. When the map is ordered, that
 * order is significant for equality between two ordered maps; otherwise
 * maps compare as unordered collections.
 *
 * Keys are matched with key_equal(), so 1, 1.0 and true name the same
 * entry.
 */
class Map {
public:
    using Entry = std::pair<Value, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Map() = default;
    explicit Map(bool ordered) noexcept : ordered_(ordered) {}

    [[nodiscard]] bool ordered() const noexcept { return ordered_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Insert a new entry.
     *
     * @param key Entry key, must be hashable
     * @param value Entry value
     * @return Error::Ok, Error::UnhashableKey or Error::DuplicateKey
     */
    Error insert(Value key, Value value);

    /**
     * @brief Look up a key.
     * @return Pointer to the mapped value, or nullptr if absent
     */
    const Value* find(const Value& key) const;

    /// Entry whose key matches, or nullptr if absent
    const Entry* find_entry(const Value& key) const;

    [[nodiscard]] bool contains(const Value& key) const;

    /// Mapped value for key; throws std::out_of_range if absent
    const Value& at(const Value& key) const;

    void reserve(std::size_t count);

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    std::vector<Entry> entries_;
    std::unordered_multimap<std::size_t, std::size_t> index_; // key_hash -> entry position
    bool ordered_ = false;
};

/**
 * @brief A decoded MessagePack value.
 *
 * Non-negative integers are held as std::uint64_t and negative ones as
 * std::int64_t, so a number compares equal regardless of the width that
 * encoded it. Floats are held as double.
 */
class Value {
public:
    enum class Type : std::uint8_t { Nil, Boolean, Integer, Float, String, Binary, Array, Map, Ext };

    Value() noexcept = default;
    Value(Nil) noexcept {}
    Value(bool b) noexcept : storage_(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) noexcept {
        if constexpr (std::is_signed_v<T>) {
            if (v < 0) {
                storage_ = static_cast<std::int64_t>(v);
                return;
            }
        }
        storage_ = static_cast<std::uint64_t>(v);
    }

    Value(float f) noexcept : storage_(static_cast<double>(f)) {}
    Value(double d) noexcept : storage_(d) {}
    Value(std::string s) : storage_(std::move(s)) {}
    Value(std::string_view s) : storage_(std::string(s)) {}
    Value(const char* s) : storage_(std::string(s)) {}
    Value(Binary b) : storage_(std::move(b)) {}
    Value(Array a) : storage_(std::move(a)) {}
    Value(Map m) : storage_(std::move(m)) {}
    Value(Ext e) : storage_(std::move(e)) {}

    [[nodiscard]] Type type() const noexcept;

    [[nodiscard]] bool is_nil() const noexcept { return std::holds_alternative<Nil>(storage_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] bool is_integer() const noexcept {
        return std::holds_alternative<std::int64_t>(storage_) ||
               std::holds_alternative<std::uint64_t>(storage_);
    }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_string() const noexcept {
        return std::holds_alternative<std::string>(storage_);
    }
    [[nodiscard]] bool is_binary() const noexcept {
        return std::holds_alternative<Binary>(storage_);
    }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<Map>(storage_); }
    [[nodiscard]] bool is_ext() const noexcept { return std::holds_alternative<Ext>(storage_); }

    /// True for negative integers
    [[nodiscard]] bool is_negative() const noexcept {
        return std::holds_alternative<std::int64_t>(storage_);
    }

    bool as_bool() const { return std::get<bool>(storage_); }
    double as_double() const { return std::get<double>(storage_); }
    const std::string& as_string() const { return std::get<std::string>(storage_); }
    const Binary& as_binary() const { return std::get<Binary>(storage_); }
    const Array& as_array() const { return std::get<Array>(storage_); }
    const Map& as_map() const { return std::get<Map>(storage_); }
    const Ext& as_ext() const { return std::get<Ext>(storage_); }

    /// Integer as int64; throws std::out_of_range above INT64_MAX
    std::int64_t as_int64() const;

    /// Integer as uint64; throws std::out_of_range for negative values
    std::uint64_t as_uint64() const;

    /**
     * @brief Whether this value may be used as a map key.
     *
     * Maps and lists are unhashable. A tuple is hashable when all of its
     * elements are. Every other value is hashable.
     */
    [[nodiscard]] bool hashable() const noexcept;

    /**
     * @brief Hash consistent with operator==.
     *
     * Only meaningful for hashable values.
     */
    [[nodiscard]] std::size_t hash() const noexcept;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    std::variant<Nil, bool, std::int64_t, std::uint64_t, double, std::string, Binary, Array, Map,
                 Ext>
        storage_;
};

struct ValueHash {
    std::size_t operator()(const Value& value) const noexcept { return value.hash(); }
};

/**
 * @brief Map key equivalence.
 *
 * Looser than operator==: booleans count as the integers 0 and 1, and
 * integers and floats compare by numeric value, so 1, 1.0 and true are
 * the same key. Applies element-wise inside tuples. Every other pair
 * compares as with operator==.
 */
bool key_equal(const Value& lhs, const Value& rhs);

/**
 * @brief Hash consistent with key_equal().
 */
std::size_t key_hash(const Value& key);

/**
 * @brief Human-readable rendering.
 *
 * Strings are quoted and escaped, binaries print as b"\x..", lists as
 * [..], tuples as (..), maps as {k: v, ..} and extension objects as
 * Ext(type, b"..").
 */
std::string to_string(const Value& value);

/**
 * @brief Whether a byte sequence is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogate code points and code points above
 * U+10FFFF.
 */
bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace msgunpack

#endif // MSGUNPACK_VALUE_HPP
