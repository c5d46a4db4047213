/**
 * @file sink.hpp
 * @brief Byte sinks receiving encoder output.
 *
 * The encoder writes only through ByteSink and never assumes buffering or
 * flush semantics. Three sinks are provided:
 * - VectorSink appends to a caller-owned std::vector
 * - ArraySink fills a caller-provided fixed buffer (no heap allocation)
 * - StreamSink writes to a std::ostream
 */

#ifndef MSGPACKLITE_SINK_HPP
#define MSGPACKLITE_SINK_HPP

#include "config.hpp"
#include "error.hpp"

#include <iosfwd>
#include <vector>

namespace msgpacklite {

/**
 * @brief Abstract byte sink.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief Write a run of bytes.
     *
     * @param data Source bytes
     * @param size Number of bytes to write
     * @return Error::Ok on success, a sink error otherwise
     */
    virtual Error write(const std::uint8_t* data, std::size_t size) = 0;

    /**
     * @brief Write a single byte.
     *
     * @param byte Byte to write
     * @return Error::Ok on success, a sink error otherwise
     */
    virtual Error write_byte(std::uint8_t byte) {
        return write(&byte, 1);
    }
};

/**
 * @brief Sink appending to a std::vector.
 */
class VectorSink : public ByteSink {
public:
    /**
     * @param out Vector receiving the bytes; must outlive the sink
     */
    explicit VectorSink(std::vector<std::uint8_t>& out) noexcept : out_(out) {}

    Error write(const std::uint8_t* data, std::size_t size) override;
    Error write_byte(std::uint8_t byte) override;

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return out_; }

private:
    std::vector<std::uint8_t>& out_;
};

/**
 * @brief Sink over a fixed caller-provided buffer.
 *
 * A write that does not fit is rejected whole with Error::Overflow.
 */
class ArraySink : public ByteSink {
public:
    ArraySink(std::uint8_t* data, std::size_t capacity) noexcept
        : data_(data), capacity_(capacity), size_(0) {}

    Error write(const std::uint8_t* data, std::size_t size) override;
    Error write_byte(std::uint8_t byte) override;

    /**
     * @brief Get number of bytes written.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Get free space left in the buffer.
     */
    [[nodiscard]] std::size_t remaining() const noexcept { return capacity_ - size_; }

    /**
     * @brief Rewind to empty. Buffer contents are left in place.
     */
    void clear() noexcept { size_ = 0; }

private:
    std::uint8_t* data_;
    std::size_t capacity_;
    std::size_t size_;
};

/**
 * @brief Sink writing to a std::ostream.
 *
 * Any stream failure is reported as Error::SinkFailure.
 */
class StreamSink : public ByteSink {
public:
    /**
     * @param os Output stream; must outlive the sink
     */
    explicit StreamSink(std::ostream& os) noexcept : os_(os) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::ostream& os_;
};

} // namespace msgpacklite

#endif // MSGPACKLITE_SINK_HPP
