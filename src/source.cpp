/**
 * @file source.cpp
 * @brief Byte source implementations.
 */

#include <msgpacklite/source.hpp>

#include <cstring>
#include <istream>

namespace msgpacklite {

Error MemorySource::read_byte(std::uint8_t& byte) {
    if (pos_ >= size_) {
        return Error::Exhausted;
    }
    byte = data_[pos_++];
    return Error::Ok;
}

Error MemorySource::read_exact(std::uint8_t* dst, std::size_t size) {
    if (size > size_ - pos_) {
        return Error::TruncatedInput;
    }
    if (size > 0) {
        std::memcpy(dst, data_ + pos_, size);
        pos_ += size;
    }
    return Error::Ok;
}

Error StreamSource::read_byte(std::uint8_t& byte) {
    auto c = is_.get();
    if (c == std::istream::traits_type::eof()) {
        // Only a clean end of stream counts as exhaustion
        return (is_.eof() && !is_.bad()) ? Error::Exhausted : Error::SourceFailure;
    }
    byte = static_cast<std::uint8_t>(c);
    return Error::Ok;
}

Error StreamSource::read_exact(std::uint8_t* dst, std::size_t size) {
    if (size == 0) {
        return Error::Ok;
    }
    is_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(is_.gcount()) != size) {
        return (is_.eof() && !is_.bad()) ? Error::TruncatedInput : Error::SourceFailure;
    }
    return Error::Ok;
}

} // namespace msgpacklite
