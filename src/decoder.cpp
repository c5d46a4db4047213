/**
 * @file decoder.cpp
 * @brief MessagePack decoding.
 */

#include <msgpacklite/byteorder.hpp>
#include <msgpacklite/decoder.hpp>
#include <msgpacklite/format.hpp>

#include <algorithm>

namespace msgpacklite {

namespace {

Error read_bytes(ByteSource& in, std::uint8_t* dst, std::size_t size) {
    auto result = in.read_exact(dst, size);
    // A source must not report a clean end inside a value
    return result == Error::Exhausted ? Error::TruncatedInput : result;
}

/**
 * @brief Read a big-endian unsigned field of 1, 2, 4 or 8 bytes.
 */
Error read_field(ByteSource& in, std::size_t width, std::uint64_t& value) {
    std::uint8_t buf[8];
    auto result = read_bytes(in, buf, width);
    if (result != Error::Ok) {
        return result;
    }

    switch (width) {
    case 1:
        value = buf[0];
        break;
    case 2:
        value = load_be16(buf);
        break;
    case 4:
        value = load_be32(buf);
        break;
    default:
        value = load_be64(buf);
        break;
    }
    return Error::Ok;
}

/**
 * @brief Read a payload of length bytes into a byte container.
 *
 * Grows the container one chunk at a time, so a forged length field only
 * costs as much memory as the source actually delivers.
 */
template <typename Container>
Error read_payload(ByteSource& in, std::size_t length, Container& dst) {
    dst.clear();
    std::size_t done = 0;
    while (done < length) {
        std::size_t chunk = std::min(length - done, READ_CHUNK_BYTES);
        dst.resize(done + chunk);
        auto result = read_bytes(in, reinterpret_cast<std::uint8_t*>(dst.data()) + done, chunk);
        if (result != Error::Ok) {
            return result;
        }
        done += chunk;
    }
    return Error::Ok;
}

Error decode(ByteSource& in, std::uint8_t t, Value& out, const DecodeOptions& options,
             std::size_t depth);

Error decode_nested(ByteSource& in, Value& out, const DecodeOptions& options, std::size_t depth) {
    std::uint8_t t = 0;
    auto result = in.read_byte(t);
    if (result == Error::Exhausted) {
        return Error::TruncatedInput;
    }
    if (result != Error::Ok) {
        return result;
    }
    return decode(in, t, out, options, depth);
}

Error decode_array(ByteSource& in, std::size_t length, Value& out, const DecodeOptions& options,
                   std::size_t depth) {
    if (options.max_depth != 0 && depth >= options.max_depth) {
        return Error::DepthExceeded;
    }

    Array array;
    for (std::size_t i = 0; i < length; ++i) {
        Value item;
        auto result = decode_nested(in, item, options, depth + 1);
        if (result != Error::Ok) {
            return result;
        }
        array.push_back(std::move(item));
    }
    out = Value(std::move(array));
    return Error::Ok;
}

Error decode_map(ByteSource& in, std::size_t length, Value& out, const DecodeOptions& options,
                 std::size_t depth) {
    if (options.max_depth != 0 && depth >= options.max_depth) {
        return Error::DepthExceeded;
    }

    Map map;
    for (std::size_t i = 0; i < length; ++i) {
        Value key;
        auto result = decode_nested(in, key, options, depth + 1);
        if (result != Error::Ok) {
            return result;
        }
        Value item;
        result = decode_nested(in, item, options, depth + 1);
        if (result != Error::Ok) {
            return result;
        }
        map.insert(std::move(key), std::move(item));
    }
    out = Value(std::move(map));
    return Error::Ok;
}

Error decode_ext(ByteSource& in, std::size_t length, Value& out) {
    std::uint8_t type = 0;
    auto result = read_bytes(in, &type, 1);
    if (result != Error::Ok) {
        return result;
    }

    Extension ext;
    ext.type = static_cast<std::int8_t>(type);
    result = read_payload(in, length, ext.data);
    if (result != Error::Ok) {
        return result;
    }
    out = Value(std::move(ext));
    return Error::Ok;
}

Error decode(ByteSource& in, std::uint8_t t, Value& out, const DecodeOptions& options,
             std::size_t depth) {
    std::uint64_t field = 0;
    Error result = Error::Ok;

    switch (classify(t)) {
    case Format::PositiveFixint:
        out = Value(static_cast<std::int64_t>(t));
        return Error::Ok;

    case Format::NegativeFixint:
        out = Value(static_cast<std::int64_t>(t) - 256);
        return Error::Ok;

    case Format::Nil:
        out = Value::nil();
        return Error::Ok;

    case Format::Bool:
        out = Value(t == tag::BOOL_TRUE);
        return Error::Ok;

    case Format::Uint:
        result = read_field(in, detail::field_width(t, tag::UINT8), field);
        if (result == Error::Ok) {
            // uint 64 above INT64_MAX keeps its bit pattern
            out = Value(static_cast<std::int64_t>(field));
        }
        return result;

    case Format::Int: {
        std::size_t width = detail::field_width(t, tag::INT8);
        result = read_field(in, width, field);
        if (result != Error::Ok) {
            return result;
        }
        std::int64_t value = 0;
        switch (width) {
        case 1:
            value = static_cast<std::int8_t>(field);
            break;
        case 2:
            value = static_cast<std::int16_t>(field);
            break;
        case 4:
            value = static_cast<std::int32_t>(field);
            break;
        default:
            value = static_cast<std::int64_t>(field);
            break;
        }
        out = Value(value);
        return Error::Ok;
    }

    case Format::Float32: {
        std::uint8_t buf[4];
        result = read_bytes(in, buf, sizeof(buf));
        if (result == Error::Ok) {
            out = Value(static_cast<double>(load_float32(buf)));
        }
        return result;
    }

    case Format::Float64: {
        std::uint8_t buf[8];
        result = read_bytes(in, buf, sizeof(buf));
        if (result == Error::Ok) {
            out = Value(load_float64(buf));
        }
        return result;
    }

    case Format::FixStr:
    case Format::Str: {
        if (t >= tag::STR8) {
            result = read_field(in, detail::field_width(t, tag::STR8), field);
            if (result != Error::Ok) {
                return result;
            }
        } else {
            field = t & 0x1FU;
        }
        std::string s;
        result = read_payload(in, static_cast<std::size_t>(field), s);
        if (result == Error::Ok) {
            out = Value(std::move(s));
        }
        return result;
    }

    case Format::Bin: {
        result = read_field(in, detail::field_width(t, tag::BIN8), field);
        if (result != Error::Ok) {
            return result;
        }
        Binary bytes;
        result = read_payload(in, static_cast<std::size_t>(field), bytes);
        if (result == Error::Ok) {
            out = Value(std::move(bytes));
        }
        return result;
    }

    case Format::FixArray:
        return decode_array(in, t & 0x0FU, out, options, depth);

    case Format::Array:
        // array 16 / array 32: 2 or 4 byte length
        result = read_field(in, detail::field_width(t, tag::ARRAY16) * 2, field);
        if (result != Error::Ok) {
            return result;
        }
        return decode_array(in, static_cast<std::size_t>(field), out, options, depth);

    case Format::FixMap:
        return decode_map(in, t & 0x0FU, out, options, depth);

    case Format::Map:
        result = read_field(in, detail::field_width(t, tag::MAP16) * 2, field);
        if (result != Error::Ok) {
            return result;
        }
        return decode_map(in, static_cast<std::size_t>(field), out, options, depth);

    case Format::FixExt:
        return decode_ext(in, detail::field_width(t, tag::FIXEXT1), out);

    case Format::Ext:
        result = read_field(in, detail::field_width(t, tag::EXT8), field);
        if (result != Error::Ok) {
            return result;
        }
        return decode_ext(in, static_cast<std::size_t>(field), out);

    default:
        return Error::UnknownTag;
    }
}

} // namespace

Error read_value(ByteSource& in, Value& out, const DecodeOptions& options) {
    std::uint8_t t = 0;
    auto result = in.read_byte(t);
    if (result == Error::Exhausted) {
        out = Value::end_of_input();
        return Error::Ok;
    }
    if (result != Error::Ok) {
        return result;
    }
    return read_value_after_tag(in, t, out, options);
}

Error read_value_after_tag(ByteSource& in, std::uint8_t tag_byte, Value& out,
                           const DecodeOptions& options) {
    Value value;
    auto result = decode(in, tag_byte, value, options, 0);
    if (result == Error::Ok) {
        out = std::move(value);
    }
    return result;
}

} // namespace msgpacklite
