/**
 * @file error.hpp
 * @brief msgpacklite error handling.
 *
 * Every codec operation returns an Error code. Builds with exceptions
 * enabled additionally get an exception hierarchy, raised only by the
 * throwing convenience API in msgpacklite.hpp.
 */

#ifndef MSGPACKLITE_ERROR_HPP
#define MSGPACKLITE_ERROR_HPP

#include "config.hpp"

#if !MSGPACKLITE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace msgpacklite {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                ///< Success
    UnsupportedValue = -1, ///< Value kind has no wire representation
    UnknownTag = -2,       ///< Tag byte matches no defined format
    TruncatedInput = -3,   ///< Source ended inside a value
    InvalidArg = -4,       ///< Length does not fit the 32-bit length field
    Overflow = -5,         ///< Fixed-capacity sink is full
    SinkFailure = -6,      ///< Underlying output transport failed
    SourceFailure = -7,    ///< Underlying input transport failed
    DepthExceeded = -8,    ///< Container nesting deeper than allowed
    Exhausted = -9         ///< Source has no byte left (ByteSource::read_byte only)
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::UnsupportedValue:
        return "Unsupported value";
    case Error::UnknownTag:
        return "Unknown type tag";
    case Error::TruncatedInput:
        return "Truncated input";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::SinkFailure:
        return "Sink write failed";
    case Error::SourceFailure:
        return "Source read failed";
    case Error::DepthExceeded:
        return "Nesting depth exceeded";
    case Error::Exhausted:
        return "Source exhausted";
    default:
        return "Unknown error";
    }
}

#if !MSGPACKLITE_NO_EXCEPTIONS

/**
 * @brief Base exception for msgpacklite errors.
 */
class MsgpackException : public std::runtime_error {
public:
    explicit MsgpackException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for values without a wire representation.
 */
class UnsupportedValueException : public MsgpackException {
public:
    explicit UnsupportedValueException(const std::string& message)
        : MsgpackException(message, Error::UnsupportedValue) {}
};

/**
 * @brief Exception for undefined tag bytes.
 */
class UnknownTagException : public MsgpackException {
public:
    explicit UnknownTagException(const std::string& message)
        : MsgpackException(message, Error::UnknownTag) {}
};

/**
 * @brief Exception for input ending inside a value.
 */
class TruncatedInputException : public MsgpackException {
public:
    explicit TruncatedInputException(const std::string& message)
        : MsgpackException(message, Error::TruncatedInput) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public MsgpackException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : MsgpackException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for buffer overflow.
 */
class OverflowException : public MsgpackException {
public:
    explicit OverflowException(const std::string& message)
        : MsgpackException(message, Error::Overflow) {}
};

/**
 * @brief Exception for sink or source transport failures.
 */
class IoException : public MsgpackException {
public:
    IoException(const std::string& message, Error code)
        : MsgpackException(message, code) {}
};

/**
 * @brief Exception for nesting beyond DecodeOptions::max_depth.
 */
class DepthExceededException : public MsgpackException {
public:
    explicit DepthExceededException(const std::string& message)
        : MsgpackException(message, Error::DepthExceeded) {}
};

/**
 * @brief Throw the exception type matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Operation name prefixed to the message
 */
inline void throw_if_error(Error error, const char* context) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = std::string(context) + ": " + error_string(error);
    switch (error) {
    case Error::UnsupportedValue:
        throw UnsupportedValueException(message);
    case Error::UnknownTag:
        throw UnknownTagException(message);
    case Error::TruncatedInput:
    case Error::Exhausted:
        throw TruncatedInputException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::SinkFailure:
    case Error::SourceFailure:
        throw IoException(message, error);
    case Error::DepthExceeded:
        throw DepthExceededException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !MSGPACKLITE_NO_EXCEPTIONS

} // namespace msgpacklite

#endif // MSGPACKLITE_ERROR_HPP
