/**
 * @file value.cpp
 * @brief Value, Array and Map implementation and text rendering.
 */

#include <msgpacklite/hex.hpp>
#include <msgpacklite/value.hpp>

#include <charconv>
#include <cmath>
#include <functional>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace msgpacklite {

const char* to_string(Type type) noexcept {
    switch (type) {
    case Type::Nil:
        return "nil";
    case Type::Bool:
        return "bool";
    case Type::Int:
        return "int";
    case Type::Float:
        return "float";
    case Type::Str:
        return "str";
    case Type::Bin:
        return "bin";
    case Type::Array:
        return "array";
    case Type::Map:
        return "map";
    case Type::Ext:
        return "ext";
    case Type::EndOfInput:
        return "end-of-input";
    default:
        return "unknown";
    }
}

// ----------------------------------------------------------------------------
// Array
// ----------------------------------------------------------------------------

Array::Array() = default;

Array::Array(std::initializer_list<Value> items) : items_(items) {}

void Array::push_back(Value value) {
    items_.push_back(std::move(value));
}

std::size_t Array::size() const noexcept {
    return items_.size();
}

bool Array::empty() const noexcept {
    return items_.empty();
}

Value& Array::operator[](std::size_t index) {
    return items_[index];
}

const Value& Array::operator[](std::size_t index) const {
    return items_[index];
}

bool Array::erase(std::size_t index) {
    if (index >= items_.size()) {
        return false;
    }
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

void Array::clear() noexcept {
    items_.clear();
}

void Array::reserve(std::size_t n) {
    items_.reserve(n);
}

Value* Array::begin() noexcept {
    return items_.data();
}

Value* Array::end() noexcept {
    return items_.data() + items_.size();
}

const Value* Array::begin() const noexcept {
    return items_.data();
}

const Value* Array::end() const noexcept {
    return items_.data() + items_.size();
}

bool operator==(const Array& a, const Array& b) {
    return a.items_ == b.items_;
}

// ----------------------------------------------------------------------------
// Map
// ----------------------------------------------------------------------------

Map::Map() = default;

Map::Map(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        insert(entry.first, entry.second);
    }
}

std::size_t Map::locate(const Value& key, std::size_t hash) const {
    auto range = index_.equal_range(hash);
    for (auto it = range.first; it != range.second; ++it) {
        if (entries_[it->second].first == key) {
            return it->second;
        }
    }
    return entries_.size();
}

void Map::reindex() {
    index_.clear();
    index_.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(hash_value(entries_[i].first), i);
    }
}

bool Map::insert(Value key, Value value) {
    std::size_t hash = hash_value(key);
    std::size_t pos = locate(key, hash);
    if (pos != entries_.size()) {
        entries_[pos].second = std::move(value);
        return false;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    try {
        index_.emplace(hash, pos);
    } catch (const std::bad_alloc&) {
        entries_.pop_back();
        throw;
    }
    return true;
}

const Value* Map::find(const Value& key) const {
    std::size_t pos = locate(key, hash_value(key));
    return pos == entries_.size() ? nullptr : &entries_[pos].second;
}

Value* Map::find(const Value& key) {
    std::size_t pos = locate(key, hash_value(key));
    return pos == entries_.size() ? nullptr : &entries_[pos].second;
}

bool Map::contains(const Value& key) const {
    return find(key) != nullptr;
}

const Value& Map::at(const Value& key) const {
    const Value* value = find(key);
    if (value == nullptr) {
        throw std::out_of_range("msgpacklite::Map::at: key not found");
    }
    return *value;
}

Value& Map::at(const Value& key) {
    Value* value = find(key);
    if (value == nullptr) {
        throw std::out_of_range("msgpacklite::Map::at: key not found");
    }
    return *value;
}

bool Map::erase(const Value& key) {
    std::size_t pos = locate(key, hash_value(key));
    if (pos == entries_.size()) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    reindex();
    return true;
}

void Map::clear() noexcept {
    entries_.clear();
    index_.clear();
}

std::size_t Map::size() const noexcept {
    return entries_.size();
}

bool Map::empty() const noexcept {
    return entries_.empty();
}

const Map::Entry* Map::begin() const noexcept {
    return entries_.data();
}

const Map::Entry* Map::end() const noexcept {
    return entries_.data() + entries_.size();
}

bool operator==(const Map& a, const Map& b) {
    return a.entries_ == b.entries_;
}

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

std::int64_t Value::to_int64() const {
    if (is_int()) {
        return as_int();
    }

    double d = as_double();
    if (std::isnan(d)) {
        return 0;
    }
    // 2^63 is exactly representable; anything at or above it saturates.
    constexpr double two_pow_63 = 9223372036854775808.0;
    if (d >= two_pow_63) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (d < -two_pow_63) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(d);
}

double Value::to_double() const {
    if (is_float()) {
        return as_double();
    }
    return static_cast<double>(as_int());
}

bool operator==(const Value& a, const Value& b) {
    return a.data_ == b.data_;
}

// ----------------------------------------------------------------------------
// Hashing
// ----------------------------------------------------------------------------

namespace {

std::size_t hash_combine(std::size_t seed, std::size_t h) noexcept {
    constexpr auto golden = static_cast<std::size_t>(0x9E3779B97F4A7C15ULL);
    return seed ^ (h + golden + (seed << 6) + (seed >> 2));
}

std::size_t hash_bytes(const std::vector<std::uint8_t>& bytes) {
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

} // namespace

std::size_t hash_value(const Value& value) {
    std::size_t seed = static_cast<std::size_t>(value.type());

    switch (value.type()) {
    case Type::Bool:
        return hash_combine(seed, value.as_bool() ? 1U : 0U);
    case Type::Int:
        return hash_combine(seed, std::hash<std::int64_t>{}(value.as_int()));
    case Type::Float: {
        // 0.0 == -0.0, so both must land in the same bucket
        double d = value.as_double();
        return hash_combine(seed, d == 0.0 ? 0U : std::hash<double>{}(d));
    }
    case Type::Str:
        return hash_combine(seed, std::hash<std::string>{}(value.as_string()));
    case Type::Bin:
        return hash_combine(seed, hash_bytes(value.as_binary()));
    case Type::Array:
        for (const auto& item : value.as_array()) {
            seed = hash_combine(seed, hash_value(item));
        }
        return seed;
    case Type::Map:
        for (const auto& [key, item] : value.as_map()) {
            seed = hash_combine(seed, hash_value(key));
            seed = hash_combine(seed, hash_value(item));
        }
        return seed;
    case Type::Ext: {
        const Extension& ext = value.as_extension();
        seed = hash_combine(seed, static_cast<std::size_t>(static_cast<std::uint8_t>(ext.type)));
        return hash_combine(seed, hash_bytes(ext.data));
    }
    default:
        return seed;
    }
}

// ----------------------------------------------------------------------------
// Text rendering
// ----------------------------------------------------------------------------

namespace {

void render_string(std::string& out, const std::string& s) {
    out.push_back('"');
    for (unsigned char c : s) {
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
            if (c < 0x20) {
                out += "\\u00";
                out.push_back(detail::HEX_DIGITS[c >> 4]);
                out.push_back(detail::HEX_DIGITS[c & 0x0F]);
            } else {
                out.push_back(static_cast<char>(c));
            }
            break;
        }
    }
    out.push_back('"');
}

void render_double(std::string& out, double d) {
    if (std::isnan(d)) {
        out += "nan";
        return;
    }
    if (std::isinf(d)) {
        out += d < 0 ? "-inf" : "inf";
        return;
    }

    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text(buf, static_cast<std::size_t>(result.ptr - buf));
    out += text;
    // Keep floats distinguishable from ints
    if (text.find_first_of(".e") == std::string_view::npos) {
        out += ".0";
    }
}

void render(std::string& out, const Value& value) {
    switch (value.type()) {
    case Type::Nil:
        out += "nil";
        break;
    case Type::Bool:
        out += value.as_bool() ? "true" : "false";
        break;
    case Type::Int:
        out += std::to_string(value.as_int());
        break;
    case Type::Float:
        render_double(out, value.as_double());
        break;
    case Type::Str:
        render_string(out, value.as_string());
        break;
    case Type::Bin:
        out += "<bin ";
        out += to_hex(value.as_binary());
        out.push_back('>');
        break;
    case Type::Array: {
        out.push_back('[');
        bool first = true;
        for (const auto& item : value.as_array()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            render(out, item);
        }
        out.push_back(']');
        break;
    }
    case Type::Map: {
        out.push_back('{');
        bool first = true;
        for (const auto& [key, item] : value.as_map()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            render(out, key);
            out += ": ";
            render(out, item);
        }
        out.push_back('}');
        break;
    }
    case Type::Ext: {
        const auto& ext = value.as_extension();
        out += "<ext ";
        out += std::to_string(static_cast<int>(ext.type));
        out.push_back(' ');
        out += to_hex(ext.data);
        out.push_back('>');
        break;
    }
    case Type::EndOfInput:
        out += "<end-of-input>";
        break;
    }
}

} // namespace

std::string to_string(const Value& value) {
    std::string out;
    render(out, value);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << to_string(value);
}

} // namespace msgpacklite
