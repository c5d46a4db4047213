/**
 * @file decoder.hpp
 * @brief MessagePack decoding.
 *
 * One call to read_value performs one decode cycle:
 * 1. read the tag byte; a source exhausted before it yields EndOfInput
 * 2. dispatch on the tag (see format.hpp for the tag table)
 * 3. read the big-endian length field, then the payload bytes or the
 *    nested values (key then value for maps)
 *
 * Any short read after the tag fails with Error::TruncatedInput and leaves
 * the output untouched; nothing partial is returned. Unsigned wire values
 * are zero-extended, never sign-extended.
 */

#ifndef MSGPACKLITE_DECODER_HPP
#define MSGPACKLITE_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "source.hpp"
#include "value.hpp"

namespace msgpacklite {

/**
 * @brief Decode one value.
 *
 * @param in Byte source positioned at a value boundary
 * @param[out] out Decoded value, or EndOfInput if the source was empty;
 *             unchanged on error
 * @param options Caller policy (nesting limit)
 * @return Error::Ok on success (including EndOfInput),
 *         Error::UnknownTag, Error::TruncatedInput, Error::DepthExceeded,
 *         or a source failure
 */
Error read_value(ByteSource& in, Value& out, const DecodeOptions& options = {});

/**
 * @brief Decode the value that follows an already consumed tag byte.
 *
 * Lets callers peek at the tag themselves. Exhaustion after the tag is
 * always Error::TruncatedInput.
 *
 * @param in Byte source positioned just after the tag
 * @param tag_byte Tag byte
 * @param[out] out Decoded value; unchanged on error
 * @param options Caller policy (nesting limit)
 */
Error read_value_after_tag(ByteSource& in, std::uint8_t tag_byte, Value& out,
                           const DecodeOptions& options = {});

} // namespace msgpacklite

#endif // MSGPACKLITE_DECODER_HPP
