/**
 * @file format.hpp
 * @brief MessagePack tag byte table and tag classification.
 *
 * These values are the interoperability contract with every other
 * MessagePack implementation and must not change.
 */

#ifndef MSGPACKLITE_FORMAT_HPP
#define MSGPACKLITE_FORMAT_HPP

#include <cstddef>
#include <cstdint>

namespace msgpacklite {

namespace tag {
inline constexpr std::uint8_t POSITIVE_FIXINT_MAX = 0x7FU;
inline constexpr std::uint8_t FIXMAP = 0x80U;
inline constexpr std::uint8_t FIXARRAY = 0x90U;
inline constexpr std::uint8_t FIXSTR = 0xA0U;

inline constexpr std::uint8_t NIL = 0xC0U;
inline constexpr std::uint8_t NEVER_USED = 0xC1U;
inline constexpr std::uint8_t BOOL_FALSE = 0xC2U;
inline constexpr std::uint8_t BOOL_TRUE = 0xC3U;

inline constexpr std::uint8_t BIN8 = 0xC4U;
inline constexpr std::uint8_t BIN16 = 0xC5U;
inline constexpr std::uint8_t BIN32 = 0xC6U;

inline constexpr std::uint8_t EXT8 = 0xC7U;
inline constexpr std::uint8_t EXT16 = 0xC8U;
inline constexpr std::uint8_t EXT32 = 0xC9U;

inline constexpr std::uint8_t FLOAT32 = 0xCAU;
inline constexpr std::uint8_t FLOAT64 = 0xCBU;

inline constexpr std::uint8_t UINT8 = 0xCCU;
inline constexpr std::uint8_t UINT16 = 0xCDU;
inline constexpr std::uint8_t UINT32 = 0xCEU;
inline constexpr std::uint8_t UINT64 = 0xCFU;

inline constexpr std::uint8_t INT8 = 0xD0U;
inline constexpr std::uint8_t INT16 = 0xD1U;
inline constexpr std::uint8_t INT32 = 0xD2U;
inline constexpr std::uint8_t INT64 = 0xD3U;

inline constexpr std::uint8_t FIXEXT1 = 0xD4U;
inline constexpr std::uint8_t FIXEXT2 = 0xD5U;
inline constexpr std::uint8_t FIXEXT4 = 0xD6U;
inline constexpr std::uint8_t FIXEXT8 = 0xD7U;
inline constexpr std::uint8_t FIXEXT16 = 0xD8U;

inline constexpr std::uint8_t STR8 = 0xD9U;
inline constexpr std::uint8_t STR16 = 0xDAU;
inline constexpr std::uint8_t STR32 = 0xDBU;

inline constexpr std::uint8_t ARRAY16 = 0xDCU;
inline constexpr std::uint8_t ARRAY32 = 0xDDU;

inline constexpr std::uint8_t MAP16 = 0xDEU;
inline constexpr std::uint8_t MAP32 = 0xDFU;

inline constexpr std::uint8_t NEGATIVE_FIXINT = 0xE0U;
} // namespace tag

/**
 * @brief Wire format family selected by a tag byte.
 */
enum class Format {
    PositiveFixint,
    FixMap,
    FixArray,
    FixStr,
    Nil,
    Bool,
    Bin,
    Ext,
    Float32,
    Float64,
    Uint,
    Int,
    FixExt,
    Str,
    Array,
    Map,
    NegativeFixint,
    Unknown
};

/**
 * @brief Classify a tag byte.
 *
 * @param t Tag byte
 * @return Format family, Format::Unknown for 0xC1
 */
constexpr Format classify(std::uint8_t t) noexcept {
    if (t <= tag::POSITIVE_FIXINT_MAX) {
        return Format::PositiveFixint;
    }
    if (t >= tag::NEGATIVE_FIXINT) {
        return Format::NegativeFixint;
    }
    if (t < tag::FIXARRAY) {
        return Format::FixMap;
    }
    if (t < tag::FIXSTR) {
        return Format::FixArray;
    }
    if (t < tag::NIL) {
        return Format::FixStr;
    }

    switch (t) {
    case tag::NIL:
        return Format::Nil;
    case tag::BOOL_FALSE:
    case tag::BOOL_TRUE:
        return Format::Bool;
    case tag::BIN8:
    case tag::BIN16:
    case tag::BIN32:
        return Format::Bin;
    case tag::EXT8:
    case tag::EXT16:
    case tag::EXT32:
        return Format::Ext;
    case tag::FLOAT32:
        return Format::Float32;
    case tag::FLOAT64:
        return Format::Float64;
    case tag::UINT8:
    case tag::UINT16:
    case tag::UINT32:
    case tag::UINT64:
        return Format::Uint;
    case tag::INT8:
    case tag::INT16:
    case tag::INT32:
    case tag::INT64:
        return Format::Int;
    case tag::FIXEXT1:
    case tag::FIXEXT2:
    case tag::FIXEXT4:
    case tag::FIXEXT8:
    case tag::FIXEXT16:
        return Format::FixExt;
    case tag::STR8:
    case tag::STR16:
    case tag::STR32:
        return Format::Str;
    case tag::ARRAY16:
    case tag::ARRAY32:
        return Format::Array;
    case tag::MAP16:
    case tag::MAP32:
        return Format::Map;
    default:
        return Format::Unknown;
    }
}

namespace detail {
/**
 * @brief Width in bytes of the length or value field following a tag.
 *
 * The 8/16/32/64 families are laid out in consecutive tag order, so the
 * width is 1 << (tag - first tag of the family).
 */
constexpr std::size_t field_width(std::uint8_t t, std::uint8_t family_first) noexcept {
    return std::size_t{1} << static_cast<unsigned>(t - family_first);
}
} // namespace detail

} // namespace msgpacklite

#endif // MSGPACKLITE_FORMAT_HPP
