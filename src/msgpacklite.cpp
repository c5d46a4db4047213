/**
 * @file msgpacklite.cpp
 * @brief High-level buffer API.
 */

#include <msgpacklite/msgpacklite.hpp>

namespace msgpacklite {

Error pack(const Value& value, std::vector<std::uint8_t>& out, const EncodeOptions& options) {
    VectorSink sink(out);
    return write_value(sink, value, options);
}

Error unpack(const std::uint8_t* data, std::size_t size, Value& out, std::size_t& consumed,
             const DecodeOptions& options) {
    MemorySource source(data, size);
    consumed = 0;
    auto result = read_value(source, out, options);
    if (result == Error::Ok) {
        consumed = source.position();
    }
    return result;
}

Error unpack(const std::uint8_t* data, std::size_t size, Value& out,
             const DecodeOptions& options) {
    std::size_t consumed = 0;
    return unpack(data, size, out, consumed, options);
}

Error unpack_all(const std::uint8_t* data, std::size_t size, std::vector<Value>& out,
                 const DecodeOptions& options) {
    MemorySource source(data, size);
    while (true) {
        Value value;
        auto result = read_value(source, value, options);
        if (result != Error::Ok) {
            return result;
        }
        if (value.is_end_of_input()) {
            return Error::Ok;
        }
        out.push_back(std::move(value));
    }
}

#if !MSGPACKLITE_NO_EXCEPTIONS

std::vector<std::uint8_t> encode(const Value& value, const EncodeOptions& options) {
    std::vector<std::uint8_t> out;
    throw_if_error(pack(value, out, options), "msgpacklite::encode");
    return out;
}

Value decode(const std::uint8_t* data, std::size_t size, const DecodeOptions& options) {
    Value value;
    std::size_t consumed = 0;
    throw_if_error(unpack(data, size, value, consumed, options), "msgpacklite::decode");
    if (consumed != size && !value.is_end_of_input()) {
        throw InvalidArgumentException("msgpacklite::decode: trailing bytes after value");
    }
    return value;
}

Value decode(const std::vector<std::uint8_t>& bytes, const DecodeOptions& options) {
    return decode(bytes.data(), bytes.size(), options);
}

#endif // !MSGPACKLITE_NO_EXCEPTIONS

} // namespace msgpacklite
