/**
 * @file sink.cpp
 * @brief Byte sink implementations.
 */

#include <msgpacklite/sink.hpp>

#include <cstring>
#include <ostream>

namespace msgpacklite {

Error VectorSink::write(const std::uint8_t* data, std::size_t size) {
    out_.insert(out_.end(), data, data + size);
    return Error::Ok;
}

Error VectorSink::write_byte(std::uint8_t byte) {
    out_.push_back(byte);
    return Error::Ok;
}

Error ArraySink::write(const std::uint8_t* data, std::size_t size) {
    if (size > capacity_ - size_) {
        return Error::Overflow;
    }
    if (size > 0) {
        std::memcpy(data_ + size_, data, size);
        size_ += size;
    }
    return Error::Ok;
}

Error ArraySink::write_byte(std::uint8_t byte) {
    if (size_ >= capacity_) {
        return Error::Overflow;
    }
    data_[size_++] = byte;
    return Error::Ok;
}

Error StreamSink::write(const std::uint8_t* data, std::size_t size) {
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return os_.good() ? Error::Ok : Error::SinkFailure;
}

} // namespace msgpacklite
