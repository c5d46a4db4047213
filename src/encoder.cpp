/**
 * @file encoder.cpp
 * @brief MessagePack encoding.
 */

#include <msgpacklite/byteorder.hpp>
#include <msgpacklite/encoder.hpp>
#include <msgpacklite/format.hpp>

#include <cmath>
#include <limits>

namespace msgpacklite {

namespace {

// Tag followed by a big-endian field of 1, 2, 4 or 8 bytes, as one write.
Error write_tagged(ByteSink& out, std::uint8_t t, std::uint64_t field, std::size_t width) {
    std::uint8_t buf[9];
    buf[0] = t;
    switch (width) {
    case 1:
        buf[1] = static_cast<std::uint8_t>(field);
        break;
    case 2:
        store_be16(&buf[1], static_cast<std::uint16_t>(field));
        break;
    case 4:
        store_be32(&buf[1], static_cast<std::uint32_t>(field));
        break;
    default:
        store_be64(&buf[1], field);
        break;
    }
    return out.write(buf, 1 + width);
}

// Shared by str, bin and ext 8/16/32: the three tags of each family are
// consecutive, length field widths 1, 2 and 4.
Error write_length_header(ByteSink& out, std::uint8_t tag8, std::size_t length) {
    if (length > MAX_LENGTH) {
        return Error::InvalidArg;
    }
    if (length <= 0xFFU) {
        return write_tagged(out, tag8, length, 1);
    }
    if (length <= 0xFFFFU) {
        return write_tagged(out, static_cast<std::uint8_t>(tag8 + 1), length, 2);
    }
    return write_tagged(out, static_cast<std::uint8_t>(tag8 + 2), length, 4);
}

// Shared by array and map: fix form below 16, then 16 and 32 bit lengths.
Error write_container_header(ByteSink& out, std::uint8_t fix_tag, std::uint8_t tag16,
                             std::size_t length) {
    if (length > MAX_LENGTH) {
        return Error::InvalidArg;
    }
    if (length < 16) {
        return out.write_byte(static_cast<std::uint8_t>(fix_tag | length));
    }
    if (length <= 0xFFFFU) {
        return write_tagged(out, tag16, length, 2);
    }
    return write_tagged(out, static_cast<std::uint8_t>(tag16 + 1), length, 4);
}

bool fits_float32(double value) noexcept {
    if (std::isnan(value)) {
        return false;
    }
    if (std::isinf(value)) {
        return true;
    }
    // Out-of-range double to float conversion is undefined
    if (std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
    }
    return static_cast<double>(static_cast<float>(value)) == value;
}

} // namespace

Error write_nil(ByteSink& out) {
    return out.write_byte(tag::NIL);
}

Error write_bool(ByteSink& out, bool value) {
    return out.write_byte(value ? tag::BOOL_TRUE : tag::BOOL_FALSE);
}

Error write_int(ByteSink& out, std::int64_t value) {
    if (value >= 0) {
        return write_uint(out, static_cast<std::uint64_t>(value));
    }

    if (value >= -32) {
        return out.write_byte(static_cast<std::uint8_t>(tag::NEGATIVE_FIXINT | (value & 0x1F)));
    }
    if (value >= std::numeric_limits<std::int8_t>::min()) {
        return write_tagged(out, tag::INT8, static_cast<std::uint64_t>(value), 1);
    }
    if (value >= std::numeric_limits<std::int16_t>::min()) {
        return write_tagged(out, tag::INT16, static_cast<std::uint64_t>(value), 2);
    }
    if (value >= std::numeric_limits<std::int32_t>::min()) {
        return write_tagged(out, tag::INT32, static_cast<std::uint64_t>(value), 4);
    }
    return write_tagged(out, tag::INT64, static_cast<std::uint64_t>(value), 8);
}

Error write_uint(ByteSink& out, std::uint64_t value) {
    if (value <= tag::POSITIVE_FIXINT_MAX) {
        return out.write_byte(static_cast<std::uint8_t>(value));
    }
    if (value <= 0xFFU) {
        return write_tagged(out, tag::UINT8, value, 1);
    }
    if (value <= 0xFFFFU) {
        return write_tagged(out, tag::UINT16, value, 2);
    }
    if (value <= 0xFFFFFFFFU) {
        return write_tagged(out, tag::UINT32, value, 4);
    }
    return write_tagged(out, tag::UINT64, value, 8);
}

Error write_float32(ByteSink& out, float value) {
    std::uint8_t buf[5];
    buf[0] = tag::FLOAT32;
    store_float32(&buf[1], value);
    return out.write(buf, sizeof(buf));
}

Error write_float64(ByteSink& out, double value) {
    std::uint8_t buf[9];
    buf[0] = tag::FLOAT64;
    store_float64(&buf[1], value);
    return out.write(buf, sizeof(buf));
}

Error write_float(ByteSink& out, double value, FloatMode mode) {
    if (mode == FloatMode::Compact && fits_float32(value)) {
        return write_float32(out, static_cast<float>(value));
    }
    return write_float64(out, value);
}

Error write_string_header(ByteSink& out, std::size_t length) {
    if (length < 32) {
        return out.write_byte(static_cast<std::uint8_t>(tag::FIXSTR | length));
    }
    return write_length_header(out, tag::STR8, length);
}

Error write_string(ByteSink& out, std::string_view value) {
    auto result = write_string_header(out, value.size());
    if (result != Error::Ok || value.empty()) {
        return result;
    }
    return out.write(reinterpret_cast<const std::uint8_t*>(value.data()), value.size());
}

Error write_binary_header(ByteSink& out, std::size_t length) {
    return write_length_header(out, tag::BIN8, length);
}

Error write_binary(ByteSink& out, const std::uint8_t* data, std::size_t size) {
    auto result = write_binary_header(out, size);
    if (result != Error::Ok || size == 0) {
        return result;
    }
    return out.write(data, size);
}

Error write_binary(ByteSink& out, const Binary& bytes) {
    return write_binary(out, bytes.data(), bytes.size());
}

Error write_array_header(ByteSink& out, std::size_t length) {
    return write_container_header(out, tag::FIXARRAY, tag::ARRAY16, length);
}

Error write_map_header(ByteSink& out, std::size_t length) {
    return write_container_header(out, tag::FIXMAP, tag::MAP16, length);
}

Error write_ext_header(ByteSink& out, std::int8_t type, std::size_t length) {
    std::uint8_t fixed_tag = 0;
    switch (length) {
    case 1:
        fixed_tag = tag::FIXEXT1;
        break;
    case 2:
        fixed_tag = tag::FIXEXT2;
        break;
    case 4:
        fixed_tag = tag::FIXEXT4;
        break;
    case 8:
        fixed_tag = tag::FIXEXT8;
        break;
    case 16:
        fixed_tag = tag::FIXEXT16;
        break;
    default:
        break;
    }

    if (fixed_tag != 0) {
        std::uint8_t buf[2] = {fixed_tag, static_cast<std::uint8_t>(type)};
        return out.write(buf, sizeof(buf));
    }

    auto result = write_length_header(out, tag::EXT8, length);
    if (result != Error::Ok) {
        return result;
    }
    return out.write_byte(static_cast<std::uint8_t>(type));
}

Error write_ext(ByteSink& out, std::int8_t type, const std::uint8_t* data, std::size_t size) {
    auto result = write_ext_header(out, type, size);
    if (result != Error::Ok || size == 0) {
        return result;
    }
    return out.write(data, size);
}

Error write_ext(ByteSink& out, const Extension& ext) {
    return write_ext(out, ext.type, ext.data.data(), ext.data.size());
}

Error write_array(ByteSink& out, const Array& array, const EncodeOptions& options) {
    auto result = write_array_header(out, array.size());
    for (auto it = array.begin(); result == Error::Ok && it != array.end(); ++it) {
        result = write_value(out, *it, options);
    }
    return result;
}

Error write_map(ByteSink& out, const Map& map, const EncodeOptions& options) {
    auto result = write_map_header(out, map.size());
    for (auto it = map.begin(); result == Error::Ok && it != map.end(); ++it) {
        result = write_value(out, it->first, options);
        if (result == Error::Ok) {
            result = write_value(out, it->second, options);
        }
    }
    return result;
}

Error write_value(ByteSink& out, const Value& value, const EncodeOptions& options) {
    switch (value.type()) {
    case Type::Nil:
        return write_nil(out);
    case Type::Bool:
        return write_bool(out, value.as_bool());
    case Type::Int:
        return write_int(out, value.as_int());
    case Type::Float:
        return write_float(out, value.as_double(), options.float_mode);
    case Type::Str:
        return write_string(out, value.as_string());
    case Type::Bin:
        return write_binary(out, value.as_binary());
    case Type::Array:
        return write_array(out, value.as_array(), options);
    case Type::Map:
        return write_map(out, value.as_map(), options);
    case Type::Ext:
        return write_ext(out, value.as_extension());
    default:
        return Error::UnsupportedValue;
    }
}

} // namespace msgpacklite
