/**
 * @file encoder.hpp
 * @brief MessagePack encoding (narrowest-fit writers).
 *
 * Every writer emits the smallest wire form able to hold its argument and
 * writes only through the given ByteSink. No state is kept between calls.
 *
 * Integer ladder (write_int):
 * - [-32, -1]          negative fixint  0xE0 | (v & 0x1F)
 * - [0, 127]           positive fixint  v
 * - [-128, -33]        int 8            0xD0
 * - [128, 255]         uint 8           0xCC
 * - [-32768, -129]     int 16           0xD1
 * - [256, 65535]       uint 16          0xCD
 * - [-2^31, -32769]    int 32           0xD2
 * - [65536, 2^32-1]    uint 32          0xCE
 * - below -2^31        int 64           0xD3
 * - 2^32 and above     uint 64          0xCF
 */

#ifndef MSGPACKLITE_ENCODER_HPP
#define MSGPACKLITE_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "sink.hpp"
#include "value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace msgpacklite {

Error write_nil(ByteSink& out);
Error write_bool(ByteSink& out, bool value);

/**
 * @brief Write a signed integer using the narrowest form.
 */
Error write_int(ByteSink& out, std::int64_t value);

/**
 * @brief Write an unsigned integer using the narrowest form.
 *
 * Values up to INT64_MAX encode exactly like write_int; larger values
 * use uint 64.
 */
Error write_uint(ByteSink& out, std::uint64_t value);

Error write_float32(ByteSink& out, float value);
Error write_float64(ByteSink& out, double value);

/**
 * @brief Write a double, narrowing to float 32 when lossless.
 *
 * With FloatMode::Compact the value is written as float 32 if converting it
 * to float and back yields the same double (infinities qualify, NaN never
 * does). FloatMode::Double always writes float 64.
 */
Error write_float(ByteSink& out, double value, FloatMode mode = FloatMode::Compact);

/**
 * @brief Write a str header: fixstr (< 32), str 8, str 16 or str 32.
 *
 * @return Error::InvalidArg if length exceeds 2^32-1; nothing is written
 */
Error write_string_header(ByteSink& out, std::size_t length);

/**
 * @brief Write a string: header with its UTF-8 byte length, then the bytes.
 */
Error write_string(ByteSink& out, std::string_view value);

/**
 * @brief Write a bin header: bin 8, bin 16 or bin 32.
 */
Error write_binary_header(ByteSink& out, std::size_t length);
Error write_binary(ByteSink& out, const std::uint8_t* data, std::size_t size);
Error write_binary(ByteSink& out, const Binary& bytes);

/**
 * @brief Write an array header: fixarray (< 16), array 16 or array 32.
 *
 * The caller writes exactly length values after it.
 */
Error write_array_header(ByteSink& out, std::size_t length);

/**
 * @brief Write a map header: fixmap (< 16), map 16 or map 32.
 *
 * The caller writes exactly length key/value pairs after it, each key
 * immediately followed by its value.
 */
Error write_map_header(ByteSink& out, std::size_t length);

/**
 * @brief Write an ext header.
 *
 * Payload lengths 1, 2, 4, 8 and 16 use fixext forms; other lengths use
 * ext 8/16/32. The type code follows the length field.
 */
Error write_ext_header(ByteSink& out, std::int8_t type, std::size_t length);
Error write_ext(ByteSink& out, std::int8_t type, const std::uint8_t* data, std::size_t size);
Error write_ext(ByteSink& out, const Extension& ext);

Error write_array(ByteSink& out, const Array& array, const EncodeOptions& options = {});
Error write_map(ByteSink& out, const Map& map, const EncodeOptions& options = {});

/**
 * @brief Write any Value, recursing depth-first into containers.
 *
 * @return Error::UnsupportedValue for an EndOfInput value, which has no
 *         wire representation
 */
Error write_value(ByteSink& out, const Value& value, const EncodeOptions& options = {});

// ----------------------------------------------------------------------------
// Native type writers
//
// float always writes float 32 and double always float 64. Types outside
// this overload set do not compile.
// ----------------------------------------------------------------------------

inline Error write(ByteSink& out, std::nullptr_t) {
    return write_nil(out);
}

inline Error write(ByteSink& out, bool value) {
    return write_bool(out, value);
}

template <typename T>
std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, Error> write(ByteSink& out,
                                                                                 T value) {
    if constexpr (std::is_signed_v<T>) {
        return write_int(out, static_cast<std::int64_t>(value));
    } else {
        return write_uint(out, static_cast<std::uint64_t>(value));
    }
}

inline Error write(ByteSink& out, float value) {
    return write_float32(out, value);
}

inline Error write(ByteSink& out, double value) {
    return write_float64(out, value);
}

inline Error write(ByteSink& out, const char* value) {
    return write_string(out, std::string_view(value));
}

inline Error write(ByteSink& out, std::string_view value) {
    return write_string(out, value);
}

inline Error write(ByteSink& out, const std::string& value) {
    return write_string(out, value);
}

inline Error write(ByteSink& out, const Binary& value) {
    return write_binary(out, value);
}

inline Error write(ByteSink& out, const Extension& value) {
    return write_ext(out, value);
}

inline Error write(ByteSink& out, const Value& value) {
    return write_value(out, value);
}

template <typename T> Error write(ByteSink& out, const std::optional<T>& value);
template <typename T, typename A> Error write(ByteSink& out, const std::vector<T, A>& values);
template <typename T, std::size_t N> Error write(ByteSink& out, const std::array<T, N>& values);
template <typename K, typename V, typename C, typename A>
Error write(ByteSink& out, const std::map<K, V, C, A>& values);
template <typename K, typename V, typename H, typename E, typename A>
Error write(ByteSink& out, const std::unordered_map<K, V, H, E, A>& values);

namespace detail {
template <typename It> Error write_elements(ByteSink& out, It first, It last) {
    for (; first != last; ++first) {
        auto result = write(out, *first);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

template <typename It> Error write_pairs(ByteSink& out, It first, It last) {
    for (; first != last; ++first) {
        auto result = write(out, first->first);
        if (result != Error::Ok) {
            return result;
        }
        result = write(out, first->second);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}
} // namespace detail

template <typename T> Error write(ByteSink& out, const std::optional<T>& value) {
    if (!value) {
        return write_nil(out);
    }
    return write(out, *value);
}

template <typename T, typename A> Error write(ByteSink& out, const std::vector<T, A>& values) {
    auto result = write_array_header(out, values.size());
    if (result != Error::Ok) {
        return result;
    }
    return detail::write_elements(out, values.begin(), values.end());
}

template <typename T, std::size_t N> Error write(ByteSink& out, const std::array<T, N>& values) {
    auto result = write_array_header(out, N);
    if (result != Error::Ok) {
        return result;
    }
    return detail::write_elements(out, values.begin(), values.end());
}

template <typename K, typename V, typename C, typename A>
Error write(ByteSink& out, const std::map<K, V, C, A>& values) {
    auto result = write_map_header(out, values.size());
    if (result != Error::Ok) {
        return result;
    }
    return detail::write_pairs(out, values.begin(), values.end());
}

template <typename K, typename V, typename H, typename E, typename A>
Error write(ByteSink& out, const std::unordered_map<K, V, H, E, A>& values) {
    auto result = write_map_header(out, values.size());
    if (result != Error::Ok) {
        return result;
    }
    return detail::write_pairs(out, values.begin(), values.end());
}

} // namespace msgpacklite

#endif // MSGPACKLITE_ENCODER_HPP
