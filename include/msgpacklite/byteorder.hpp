/**
 * @file byteorder.hpp
 * @brief Fixed-width big-endian conversions.
 *
 * All multi-byte MessagePack fields are big-endian. These helpers convert
 * 16/32/64-bit integers and IEEE-754 floats to and from byte slices of the
 * exact type width, independent of host byte order.
 *
 * Signed integers go through the unsigned overloads with a static_cast;
 * the two's complement bit pattern is preserved.
 */

#ifndef MSGPACKLITE_BYTEORDER_HPP
#define MSGPACKLITE_BYTEORDER_HPP

#include <cstdint>
#include <cstring>

namespace msgpacklite {

/**
 * @brief Store a 16-bit value MSB-first.
 *
 * @param dst Destination, at least 2 bytes
 * @param value Value to store
 */
constexpr void store_be16(std::uint8_t* dst, std::uint16_t value) noexcept {
    dst[0] = static_cast<std::uint8_t>(value >> 8);
    dst[1] = static_cast<std::uint8_t>(value);
}

/**
 * @brief Store a 32-bit value MSB-first.
 *
 * @param dst Destination, at least 4 bytes
 * @param value Value to store
 */
constexpr void store_be32(std::uint8_t* dst, std::uint32_t value) noexcept {
    dst[0] = static_cast<std::uint8_t>(value >> 24);
    dst[1] = static_cast<std::uint8_t>(value >> 16);
    dst[2] = static_cast<std::uint8_t>(value >> 8);
    dst[3] = static_cast<std::uint8_t>(value);
}

/**
 * @brief Store a 64-bit value MSB-first.
 *
 * @param dst Destination, at least 8 bytes
 * @param value Value to store
 */
constexpr void store_be64(std::uint8_t* dst, std::uint64_t value) noexcept {
    store_be32(dst, static_cast<std::uint32_t>(value >> 32));
    store_be32(dst + 4, static_cast<std::uint32_t>(value));
}

/**
 * @brief Load a 16-bit MSB-first value.
 */
constexpr std::uint16_t load_be16(const std::uint8_t* src) noexcept {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(src[0]) << 8) | src[1]);
}

/**
 * @brief Load a 32-bit MSB-first value.
 */
constexpr std::uint32_t load_be32(const std::uint8_t* src) noexcept {
    return (static_cast<std::uint32_t>(src[0]) << 24) | (static_cast<std::uint32_t>(src[1]) << 16) |
           (static_cast<std::uint32_t>(src[2]) << 8) | static_cast<std::uint32_t>(src[3]);
}

/**
 * @brief Load a 64-bit MSB-first value.
 */
constexpr std::uint64_t load_be64(const std::uint8_t* src) noexcept {
    return (static_cast<std::uint64_t>(load_be32(src)) << 32) | load_be32(src + 4);
}

/**
 * @brief Store an IEEE-754 single as 4 big-endian bytes.
 */
inline void store_float32(std::uint8_t* dst, float value) noexcept {
    static_assert(sizeof(float) == 4, "IEEE-754 binary32 float required");
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store_be32(dst, bits);
}

/**
 * @brief Store an IEEE-754 double as 8 big-endian bytes.
 */
inline void store_float64(std::uint8_t* dst, double value) noexcept {
    static_assert(sizeof(double) == 8, "IEEE-754 binary64 double required");
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store_be64(dst, bits);
}

/**
 * @brief Load an IEEE-754 single from 4 big-endian bytes.
 */
inline float load_float32(const std::uint8_t* src) noexcept {
    std::uint32_t bits = load_be32(src);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

/**
 * @brief Load an IEEE-754 double from 8 big-endian bytes.
 */
inline double load_float64(const std::uint8_t* src) noexcept {
    std::uint64_t bits = load_be64(src);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace msgpacklite

#endif // MSGPACKLITE_BYTEORDER_HPP
