/**
 * @file config.hpp
 * @brief msgpacklite compile-time and runtime configuration.
 *
 * MessagePack wire format: https://github.com/msgpack/msgpack/blob/master/spec.md
 */

#ifndef MSGPACKLITE_CONFIG_HPP
#define MSGPACKLITE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace msgpacklite {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Largest payload chunk pulled from a source in one read
#ifndef MSGPACKLITE_READ_CHUNK_BYTES
#define MSGPACKLITE_READ_CHUNK_BYTES 65536U
#endif

inline constexpr std::size_t READ_CHUNK_BYTES = MSGPACKLITE_READ_CHUNK_BYTES;

/// Largest length a str/bin/ext/array/map header can carry (32-bit field)
inline constexpr std::uint64_t MAX_LENGTH = 0xFFFFFFFFULL;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MSGPACKLITE_NO_EXCEPTIONS=1 to compile out the exception types and
 * the throwing convenience API. The error-code API is always available.
 * @{
 */
#ifndef MSGPACKLITE_NO_EXCEPTIONS
#define MSGPACKLITE_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @brief Float width policy for the generic value writer.
 */
enum class FloatMode {
    Compact, ///< float32 when the value survives the narrowing exactly
    Double   ///< always float64
};

/**
 * @brief Options for encoding Value trees.
 */
struct EncodeOptions {
    FloatMode float_mode{FloatMode::Compact};
};

/**
 * @brief Options for decoding Value trees.
 */
struct DecodeOptions {
    /// Maximum container nesting depth; 0 disables the check.
    std::size_t max_depth{0};
};

} // namespace msgpacklite

#endif // MSGPACKLITE_CONFIG_HPP
