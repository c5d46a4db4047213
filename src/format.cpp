/**
 * @file format.cpp
 * @brief Tag table compilation unit.
 *
 * classify() is constexpr in format.hpp; the range boundaries are pinned
 * here so a table edit that breaks interoperability fails the build.
 */

#include <msgpacklite/format.hpp>

namespace msgpacklite {

static_assert(classify(0x00U) == Format::PositiveFixint);
static_assert(classify(0x7FU) == Format::PositiveFixint);
static_assert(classify(0x80U) == Format::FixMap);
static_assert(classify(0x8FU) == Format::FixMap);
static_assert(classify(0x90U) == Format::FixArray);
static_assert(classify(0x9FU) == Format::FixArray);
static_assert(classify(0xA0U) == Format::FixStr);
static_assert(classify(0xBFU) == Format::FixStr);
static_assert(classify(tag::NEVER_USED) == Format::Unknown);
static_assert(classify(0xDFU) == Format::Map);
static_assert(classify(0xE0U) == Format::NegativeFixint);
static_assert(classify(0xFFU) == Format::NegativeFixint);

static_assert(detail::field_width(tag::UINT64, tag::UINT8) == 8);
static_assert(detail::field_width(tag::FIXEXT16, tag::FIXEXT1) == 16);

} // namespace msgpacklite
