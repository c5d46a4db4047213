/**
 * @file byteorder.cpp
 * @brief Byte codec compilation unit.
 *
 * The conversions are inline in byteorder.hpp. The integer forms are
 * constexpr and their byte order is pinned here at compile time.
 */

#include <msgpacklite/byteorder.hpp>

#include <limits>

static_assert(std::numeric_limits<float>::is_iec559, "IEEE-754 float required");
static_assert(std::numeric_limits<double>::is_iec559, "IEEE-754 double required");

namespace msgpacklite {

namespace {

constexpr std::uint8_t SAMPLE[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

constexpr bool stores_msb_first(std::uint64_t value) {
    std::uint8_t buf[8] = {};
    store_be64(buf, value);
    for (int i = 0; i < 8; ++i) {
        if (buf[i] != static_cast<std::uint8_t>(value >> (56 - 8 * i))) {
            return false;
        }
    }
    return load_be64(buf) == value;
}

constexpr bool store16_matches(std::uint16_t value, std::uint8_t hi, std::uint8_t lo) {
    std::uint8_t buf[2] = {};
    store_be16(buf, value);
    return buf[0] == hi && buf[1] == lo;
}

} // namespace

static_assert(load_be16(SAMPLE) == 0x0102U);
static_assert(load_be32(SAMPLE) == 0x01020304U);
static_assert(load_be64(SAMPLE) == 0x0102030405060708ULL);
static_assert(store16_matches(0xFF20U, 0xFF, 0x20));
static_assert(stores_msb_first(0x0102030405060708ULL));
static_assert(stores_msb_first(0xFFFFFFFFFFFFFFFFULL));

} // namespace msgpacklite
