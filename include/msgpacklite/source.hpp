/**
 * @file source.hpp
 * @brief Byte sources feeding the decoder.
 *
 * A source distinguishes a clean end of data (Error::Exhausted from
 * read_byte) from a short read inside a value (Error::TruncatedInput from
 * read_exact). The decoder turns the first into an EndOfInput value when it
 * happens at a value boundary.
 */

#ifndef MSGPACKLITE_SOURCE_HPP
#define MSGPACKLITE_SOURCE_HPP

#include "config.hpp"
#include "error.hpp"

#include <iosfwd>

namespace msgpacklite {

/**
 * @brief Abstract byte source.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read one byte.
     *
     * @param[out] byte Byte read
     * @return Error::Ok, Error::Exhausted if no byte is available, or
     *         Error::SourceFailure
     */
    virtual Error read_byte(std::uint8_t& byte) = 0;

    /**
     * @brief Read exactly size bytes.
     *
     * @param dst Destination buffer
     * @param size Number of bytes required
     * @return Error::Ok, Error::TruncatedInput if fewer bytes are available,
     *         or Error::SourceFailure
     */
    virtual Error read_exact(std::uint8_t* dst, std::size_t size) = 0;
};

/**
 * @brief Source over an in-memory byte buffer.
 *
 * A failed read_exact does not advance the position.
 */
class MemorySource : public ByteSource {
public:
    /**
     * @param data Pointer to source data; must outlive the source
     * @param size Number of valid bytes
     */
    MemorySource(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    Error read_byte(std::uint8_t& byte) override;
    Error read_exact(std::uint8_t* dst, std::size_t size) override;

    /**
     * @brief Get number of bytes already consumed.
     */
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /**
     * @brief Get number of bytes not yet consumed.
     */
    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - pos_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Source reading from a std::istream.
 *
 * End of stream maps to Error::Exhausted or Error::TruncatedInput; a
 * stream reporting badbit maps to Error::SourceFailure.
 */
class StreamSource : public ByteSource {
public:
    /**
     * @param is Input stream; must outlive the source
     */
    explicit StreamSource(std::istream& is) noexcept : is_(is) {}

    Error read_byte(std::uint8_t& byte) override;
    Error read_exact(std::uint8_t* dst, std::size_t size) override;

private:
    std::istream& is_;
};

} // namespace msgpacklite

#endif // MSGPACKLITE_SOURCE_HPP
