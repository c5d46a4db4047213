/**
 * @file hex.hpp
 * @brief Hex rendering of encoded bytes.
 */

#ifndef MSGPACKLITE_HEX_HPP
#define MSGPACKLITE_HEX_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace msgpacklite {

namespace detail {
inline constexpr char HEX_DIGITS[] = "0123456789abcdef";
} // namespace detail

/**
 * @brief Render bytes as lowercase hex, two digits per byte, no separators.
 *
 * @param data Bytes to render
 * @param size Number of bytes
 * @return Hex string of length 2 * size
 */
inline std::string to_hex(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(detail::HEX_DIGITS[data[i] >> 4]);
        out.push_back(detail::HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

} // namespace msgpacklite

#endif // MSGPACKLITE_HEX_HPP
