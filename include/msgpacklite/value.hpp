/**
 * @file value.hpp
 * @brief Decoded MessagePack value tree.
 *
 * Value is a closed tagged union over the kinds the wire format can carry,
 * plus an EndOfInput sentinel produced by the decoder when the source is
 * cleanly exhausted.
 *
 * @par Integers
 * Int holds a signed 64-bit payload. uint64 wire values at or above 2^63
 * keep their bit pattern and read back as negative through as_int();
 * as_uint() returns the unsigned reading.
 *
 * @par Containers
 * Array and Map are owned, ordered containers exposing only what encoding
 * and decoding need. Map keys may be any Value. Inserting an existing key
 * replaces its value in place, keeping the original position.
 */

#ifndef MSGPACKLITE_VALUE_HPP
#define MSGPACKLITE_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace msgpacklite {

class Value;

/// Payload of a bin value.
using Binary = std::vector<std::uint8_t>;

/**
 * @brief Kind of a Value.
 *
 * Enumerators are ordered like the alternatives of Value's storage.
 */
enum class Type { Nil, Bool, Int, Float, Str, Bin, Array, Map, Ext, EndOfInput };

/**
 * @brief Get the name of a value kind.
 */
const char* to_string(Type type) noexcept;

struct Nil {
    friend bool operator==(const Nil&, const Nil&) = default;
};

struct EndOfInput {
    friend bool operator==(const EndOfInput&, const EndOfInput&) = default;
};

/**
 * @brief Application-defined typed payload.
 *
 * Negative type codes are reserved by the format for predefined types
 * (such as -1 for timestamps); the codec carries them unchanged.
 */
struct Extension {
    std::int8_t type{0};
    std::vector<std::uint8_t> data{};

    friend bool operator==(const Extension&, const Extension&) = default;
};

/**
 * @brief Ordered sequence of values.
 */
class Array {
public:
    Array();
    Array(std::initializer_list<Value> items);

    void push_back(Value value);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    Value& operator[](std::size_t index);
    const Value& operator[](std::size_t index) const;

    /**
     * @brief Remove the element at index, shifting later elements down.
     * @return false if index is out of range
     */
    bool erase(std::size_t index);
    void clear() noexcept;
    void reserve(std::size_t n);

    Value* begin() noexcept;
    Value* end() noexcept;
    const Value* begin() const noexcept;
    const Value* end() const noexcept;

    friend bool operator==(const Array& a, const Array& b);

private:
    std::vector<Value> items_;
};

/**
 * @brief Ordered mapping Value -> Value.
 *
 * Entries are kept in insertion order. A hash index from hash_value(key)
 * to entry position makes insert and find expected constant time; erase
 * shifts later entries and rebuilds the index.
 */
class Map {
public:
    using Entry = std::pair<Value, Value>;

    Map();
    Map(std::initializer_list<Entry> entries);

    /**
     * @brief Insert or replace.
     *
     * @return true if key was new, false if an existing value was replaced
     */
    bool insert(Value key, Value value);

    /**
     * @brief Find the value stored under key.
     * @return Pointer to the value, nullptr if absent
     */
    [[nodiscard]] const Value* find(const Value& key) const;
    [[nodiscard]] Value* find(const Value& key);
    [[nodiscard]] bool contains(const Value& key) const;

    /**
     * @brief Access the value stored under key.
     * @throws std::out_of_range if key is absent
     */
    const Value& at(const Value& key) const;
    Value& at(const Value& key);

    /**
     * @brief Remove key and its value.
     * @return false if key was absent
     */
    bool erase(const Value& key);
    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    // Keys are read-only through iteration; values change through find() or at()
    const Entry* begin() const noexcept;
    const Entry* end() const noexcept;

    /// Order-sensitive comparison.
    friend bool operator==(const Map& a, const Map& b);

private:
    std::size_t locate(const Value& key, std::size_t hash) const;
    void reindex();

    std::vector<Entry> entries_;
    std::unordered_multimap<std::size_t, std::size_t> index_;
};

/**
 * @brief A MessagePack value.
 */
class Value {
public:
    Value() noexcept : data_(Nil{}) {}
    Value(std::nullptr_t) noexcept : data_(Nil{}) {}
    Value(Nil) noexcept : data_(Nil{}) {}
    Value(bool b) noexcept : data_(b) {}

    /**
     * @brief Construct an Int from any integer type.
     *
     * Unsigned values above INT64_MAX keep their bit pattern, so they read
     * back as negative through as_int() and encode through write_value() as
     * a signed integer (UINT64_MAX becomes 0xFF). Use write_uint() or the
     * native write() overload to encode them as uint 64.
     */
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) noexcept : data_(static_cast<std::int64_t>(v)) {}

    Value(double d) noexcept : data_(d) {}
    Value(float f) noexcept : data_(static_cast<double>(f)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Binary bytes) : data_(std::move(bytes)) {}
    Value(Array array) : data_(std::move(array)) {}
    Value(Map map) : data_(std::move(map)) {}
    Value(Extension ext) : data_(std::move(ext)) {}
    Value(EndOfInput) noexcept : data_(EndOfInput{}) {}

    static Value nil() noexcept { return Value(); }
    static Value end_of_input() noexcept { return Value(EndOfInput{}); }

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }

    [[nodiscard]] bool is_nil() const noexcept { return type() == Type::Nil; }
    [[nodiscard]] bool is_bool() const noexcept { return type() == Type::Bool; }
    [[nodiscard]] bool is_int() const noexcept { return type() == Type::Int; }
    [[nodiscard]] bool is_float() const noexcept { return type() == Type::Float; }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return type() == Type::Str; }
    [[nodiscard]] bool is_binary() const noexcept { return type() == Type::Bin; }
    [[nodiscard]] bool is_array() const noexcept { return type() == Type::Array; }
    [[nodiscard]] bool is_map() const noexcept { return type() == Type::Map; }
    [[nodiscard]] bool is_extension() const noexcept { return type() == Type::Ext; }
    [[nodiscard]] bool is_end_of_input() const noexcept { return type() == Type::EndOfInput; }

    // Checked accessors; a kind mismatch throws std::bad_variant_access.
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    std::uint64_t as_uint() const { return static_cast<std::uint64_t>(as_int()); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    std::string& as_string() { return std::get<std::string>(data_); }
    const Binary& as_binary() const { return std::get<Binary>(data_); }
    Binary& as_binary() { return std::get<Binary>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Map& as_map() const { return std::get<Map>(data_); }
    Map& as_map() { return std::get<Map>(data_); }
    const Extension& as_extension() const { return std::get<Extension>(data_); }
    Extension& as_extension() { return std::get<Extension>(data_); }

    /**
     * @brief Convert a number to int64.
     *
     * Float truncates toward zero and saturates at the int64 range; NaN
     * converts to 0.
     *
     * @throws std::bad_variant_access if the value is not a number
     */
    std::int64_t to_int64() const;

    /**
     * @brief Convert a number to double.
     *
     * @throws std::bad_variant_access if the value is not a number
     */
    double to_double() const;

    friend bool operator==(const Value& a, const Value& b);

private:
    std::variant<Nil, bool, std::int64_t, double, std::string, Binary, Array, Map, Extension,
                 EndOfInput>
        data_;
};

/**
 * @brief Structural hash consistent with operator==.
 *
 * Equal values hash equal; 0.0 and -0.0 share a hash.
 */
[[nodiscard]] std::size_t hash_value(const Value& value);

/**
 * @brief Render a value as JSON-like text.
 *
 * Strings are quoted and escaped, bin and ext payloads are shown in hex.
 */
std::string to_string(const Value& value);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace msgpacklite

#endif // MSGPACKLITE_VALUE_HPP
