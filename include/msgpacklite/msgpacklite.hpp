/**
 * @file msgpacklite.hpp
 * @brief High-level msgpacklite API.
 *
 * Buffer-level pack()/unpack() functions returning Error codes, and, in
 * builds with exceptions, encode()/decode() that return their result
 * directly and throw on failure.
 */

#ifndef MSGPACKLITE_HPP
#define MSGPACKLITE_HPP

#include "byteorder.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "format.hpp"
#include "hex.hpp"
#include "sink.hpp"
#include "source.hpp"
#include "value.hpp"

#include <cstdint>
#include <vector>

namespace msgpacklite {

/**
 * @brief Append the encoding of a value to a byte vector.
 *
 * @param value Value to encode
 * @param[out] out Vector the encoding is appended to; on error it may hold
 *             a partial encoding past its original size
 * @param options Float width policy
 * @return Error::Ok on success
 */
Error pack(const Value& value, std::vector<std::uint8_t>& out, const EncodeOptions& options = {});

/**
 * @brief Decode one value from the front of a buffer.
 *
 * Bytes after the value are left alone; consumed reports where the value
 * ended. An empty buffer decodes to EndOfInput.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param[out] out Decoded value; unchanged on error
 * @param[out] consumed Bytes used by the value (0 on error)
 * @param options Nesting limit
 * @return Error::Ok on success
 */
Error unpack(const std::uint8_t* data, std::size_t size, Value& out, std::size_t& consumed,
             const DecodeOptions& options = {});

Error unpack(const std::uint8_t* data, std::size_t size, Value& out,
             const DecodeOptions& options = {});

/**
 * @brief Decode a concatenated stream of values until clean end of input.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param[out] out Decoded values are appended; on error the values decoded
 *             before the failing one are kept
 * @param options Nesting limit
 * @return Error::Ok on success
 */
Error unpack_all(const std::uint8_t* data, std::size_t size, std::vector<Value>& out,
                 const DecodeOptions& options = {});

#if !MSGPACKLITE_NO_EXCEPTIONS

/**
 * @brief Encode a value.
 * @throws MsgpackException subclass matching the failure
 */
std::vector<std::uint8_t> encode(const Value& value, const EncodeOptions& options = {});

/**
 * @brief Decode a buffer holding exactly one value.
 *
 * An empty buffer yields an EndOfInput value.
 *
 * @throws MsgpackException subclass matching the failure;
 *         InvalidArgumentException if bytes remain after the value
 */
Value decode(const std::uint8_t* data, std::size_t size, const DecodeOptions& options = {});

Value decode(const std::vector<std::uint8_t>& bytes, const DecodeOptions& options = {});

#endif // !MSGPACKLITE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace msgpacklite

#endif // MSGPACKLITE_HPP
