/**
 * @file test_encoder.cpp
 * @brief Unit tests for the narrowest-fit writers.
 */

#include <catch2/catch_test_macros.hpp>
#include <msgpacklite/encoder.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace msgpacklite;

using Bytes = std::vector<std::uint8_t>;

static Bytes encode_int(std::int64_t v) {
    Bytes out;
    VectorSink sink(out);
    REQUIRE(write_int(sink, v) == Error::Ok);
    return out;
}

static Bytes encode_value(const Value& v, const EncodeOptions& options = {}) {
    Bytes out;
    VectorSink sink(out);
    REQUIRE(write_value(sink, v, options) == Error::Ok);
    return out;
}

TEST_CASE("nil and bool", "[encoder]") {
    Bytes out;
    VectorSink sink(out);
    REQUIRE(write_nil(sink) == Error::Ok);
    REQUIRE(write_bool(sink, false) == Error::Ok);
    REQUIRE(write_bool(sink, true) == Error::Ok);
    REQUIRE(out == Bytes{0xC0, 0xC2, 0xC3});
}

TEST_CASE("integer ladder", "[encoder][int]") {
    SECTION("negative fixint") {
        REQUIRE(encode_int(-1) == Bytes{0xFF});
        REQUIRE(encode_int(-31) == Bytes{0xE1});
        REQUIRE(encode_int(-32) == Bytes{0xE0});
    }

    SECTION("positive fixint") {
        REQUIRE(encode_int(0) == Bytes{0x00});
        REQUIRE(encode_int(5) == Bytes{0x05});
        REQUIRE(encode_int(64) == Bytes{0x40});
        REQUIRE(encode_int(127) == Bytes{0x7F});
    }

    SECTION("int 8") {
        REQUIRE(encode_int(-33) == Bytes{0xD0, 0xDF});
        REQUIRE(encode_int(-128) == Bytes{0xD0, 0x80});
    }

    SECTION("uint 8") {
        REQUIRE(encode_int(128) == Bytes{0xCC, 0x80});
        REQUIRE(encode_int(200) == Bytes{0xCC, 0xC8});
        REQUIRE(encode_int(255) == Bytes{0xCC, 0xFF});
    }

    SECTION("int 16") {
        REQUIRE(encode_int(-129) == Bytes{0xD1, 0xFF, 0x7F});
        REQUIRE(encode_int(-224) == Bytes{0xD1, 0xFF, 0x20});
        REQUIRE(encode_int(-32767) == Bytes{0xD1, 0x80, 0x01});
        REQUIRE(encode_int(-32768) == Bytes{0xD1, 0x80, 0x00});
    }

    SECTION("uint 16") {
        REQUIRE(encode_int(256) == Bytes{0xCD, 0x01, 0x00});
        REQUIRE(encode_int(32768) == Bytes{0xCD, 0x80, 0x00});
        REQUIRE(encode_int(65535) == Bytes{0xCD, 0xFF, 0xFF});
    }

    SECTION("int 32") {
        REQUIRE(encode_int(-32769) == Bytes{0xD2, 0xFF, 0xFF, 0x7F, 0xFF});
        REQUIRE(encode_int(-65536) == Bytes{0xD2, 0xFF, 0xFF, 0x00, 0x00});
        REQUIRE(encode_int(std::numeric_limits<std::int32_t>::min()) ==
                Bytes{0xD2, 0x80, 0x00, 0x00, 0x00});
    }

    SECTION("uint 32") {
        REQUIRE(encode_int(65536) == Bytes{0xCE, 0x00, 0x01, 0x00, 0x00});
        REQUIRE(encode_int(4294967295LL) == Bytes{0xCE, 0xFF, 0xFF, 0xFF, 0xFF});
    }

    SECTION("int 64") {
        REQUIRE(encode_int(-2147483649LL) ==
                Bytes{0xD3, 0xFF, 0xFF, 0xFF, 0xFF, 0x7F, 0xFF, 0xFF, 0xFF});
        REQUIRE(encode_int(std::numeric_limits<std::int64_t>::min()) ==
                Bytes{0xD3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
    }

    SECTION("uint 64") {
        REQUIRE(encode_int(4294967296LL) ==
                Bytes{0xCF, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
        REQUIRE(encode_int(std::numeric_limits<std::int64_t>::max()) ==
                Bytes{0xCF, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
    }

    SECTION("negative values between -2^31 and -2^15 are not dropped") {
        REQUIRE(encode_int(-40000) == Bytes{0xD2, 0xFF, 0xFF, 0x63, 0xC0});
        REQUIRE(encode_int(-1000000) == Bytes{0xD2, 0xFF, 0xF0, 0xBD, 0xC0});
    }
}

TEST_CASE("unsigned writer", "[encoder][int]") {
    Bytes out;
    VectorSink sink(out);

    SECTION("small values match the signed ladder") {
        REQUIRE(write_uint(sink, 200) == Error::Ok);
        REQUIRE(out == Bytes{0xCC, 0xC8});
    }

    SECTION("values above INT64_MAX use uint 64") {
        REQUIRE(write_uint(sink, std::numeric_limits<std::uint64_t>::max()) == Error::Ok);
        REQUIRE(out == Bytes{0xCF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
    }
}

TEST_CASE("floats", "[encoder][float]") {
    Bytes out;
    VectorSink sink(out);

    SECTION("explicit float 32") {
        REQUIRE(write_float32(sink, 1.5F) == Error::Ok);
        REQUIRE(out == Bytes{0xCA, 0x3F, 0xC0, 0x00, 0x00});
    }

    SECTION("explicit float 64") {
        REQUIRE(write_float64(sink, 1.5) == Error::Ok);
        REQUIRE(out == Bytes{0xCB, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
    }

    SECTION("compact narrows exact values") {
        REQUIRE(encode_value(Value(1.5)) == Bytes{0xCA, 0x3F, 0xC0, 0x00, 0x00});
        REQUIRE(encode_value(Value(std::numeric_limits<double>::infinity()))[0] == 0xCA);
    }

    SECTION("compact keeps inexact values wide") {
        REQUIRE(encode_value(Value(0.1)).size() == 9);
        REQUIRE(encode_value(Value(1e300))[0] == 0xCB);
        REQUIRE(encode_value(Value(std::numeric_limits<double>::quiet_NaN()))[0] == 0xCB);
    }

    SECTION("double mode always widens") {
        EncodeOptions options;
        options.float_mode = FloatMode::Double;
        REQUIRE(encode_value(Value(1.5), options)[0] == 0xCB);
    }
}

TEST_CASE("string headers", "[encoder][str]") {
    SECTION("empty string") {
        REQUIRE(encode_value(Value("")) == Bytes{0xA0});
    }

    SECTION("fixstr") {
        REQUIRE(encode_value(Value("TST")) == Bytes{0xA3, 0x54, 0x53, 0x54});
        auto out = encode_value(Value(std::string(31, 'x')));
        REQUIRE(out.size() == 32);
        REQUIRE(out[0] == 0xBF);
    }

    SECTION("str 8") {
        auto out = encode_value(Value(std::string(32, 'x')));
        REQUIRE(out.size() == 34);
        REQUIRE(out[0] == 0xD9);
        REQUIRE(out[1] == 32);

        out = encode_value(Value(std::string(255, 'x')));
        REQUIRE(out[0] == 0xD9);
        REQUIRE(out[1] == 0xFF);
    }

    SECTION("str 16") {
        auto out = encode_value(Value(std::string(256, 'x')));
        REQUIRE(out.size() == 259);
        REQUIRE(out[0] == 0xDA);
        REQUIRE(out[1] == 0x01);
        REQUIRE(out[2] == 0x00);
    }

    SECTION("str 32") {
        auto out = encode_value(Value(std::string(65536, 'x')));
        REQUIRE(out.size() == 65541);
        REQUIRE(out[0] == 0xDB);
        REQUIRE(out[1] == 0x00);
        REQUIRE(out[2] == 0x01);
        REQUIRE(out[3] == 0x00);
        REQUIRE(out[4] == 0x00);
    }

    SECTION("length counts UTF-8 bytes") {
        // "é" is two bytes in UTF-8
        REQUIRE(encode_value(Value("\xC3\xA9")) == Bytes{0xA2, 0xC3, 0xA9});
    }

    SECTION("header rejects lengths beyond 32 bits") {
        if constexpr (sizeof(std::size_t) > 4) {
            Bytes out;
            VectorSink sink(out);
            REQUIRE(write_string_header(sink, std::size_t{1} << 32) == Error::InvalidArg);
            REQUIRE(out.empty());
        }
    }
}

TEST_CASE("binary headers", "[encoder][bin]") {
    SECTION("empty binary uses bin 8") {
        REQUIRE(encode_value(Value(Binary{})) == Bytes{0xC4, 0x00});
    }

    SECTION("bin 8") {
        REQUIRE(encode_value(Value(Binary{0xDE, 0xAD})) == Bytes{0xC4, 0x02, 0xDE, 0xAD});
    }

    SECTION("bin 16") {
        auto out = encode_value(Value(Binary(256, 0x00)));
        REQUIRE(out[0] == 0xC5);
        REQUIRE(out[1] == 0x01);
        REQUIRE(out[2] == 0x00);
    }

    SECTION("bin 32") {
        auto out = encode_value(Value(Binary(65536, 0x00)));
        REQUIRE(out[0] == 0xC6);
        REQUIRE(out.size() == 65536 + 5);
    }
}

TEST_CASE("container headers", "[encoder][array][map]") {
    Bytes out;
    VectorSink sink(out);

    SECTION("fixarray boundary") {
        REQUIRE(write_array_header(sink, 15) == Error::Ok);
        REQUIRE(write_array_header(sink, 16) == Error::Ok);
        REQUIRE(out == Bytes{0x9F, 0xDC, 0x00, 0x10});
    }

    SECTION("array 32") {
        REQUIRE(write_array_header(sink, 65536) == Error::Ok);
        REQUIRE(out == Bytes{0xDD, 0x00, 0x01, 0x00, 0x00});
    }

    SECTION("fixmap boundary") {
        REQUIRE(write_map_header(sink, 0) == Error::Ok);
        REQUIRE(write_map_header(sink, 15) == Error::Ok);
        REQUIRE(write_map_header(sink, 65535) == Error::Ok);
        REQUIRE(out == Bytes{0x80, 0x8F, 0xDE, 0xFF, 0xFF});
    }

    SECTION("map 32") {
        REQUIRE(write_map_header(sink, 70000) == Error::Ok);
        REQUIRE(out == Bytes{0xDF, 0x00, 0x01, 0x11, 0x70});
    }
}

TEST_CASE("extension headers", "[encoder][ext]") {
    Bytes out;
    VectorSink sink(out);

    SECTION("fixext sizes") {
        const std::size_t sizes[] = {1, 2, 4, 8, 16};
        const std::uint8_t tags[] = {0xD4, 0xD5, 0xD6, 0xD7, 0xD8};
        for (int i = 0; i < 5; ++i) {
            out.clear();
            REQUIRE(write_ext_header(sink, 7, sizes[i]) == Error::Ok);
            REQUIRE(out == Bytes{tags[i], 0x07});
        }
    }

    SECTION("ext 8 for other small sizes") {
        REQUIRE(write_ext(sink, Extension{-1, {1, 2, 3}}) == Error::Ok);
        REQUIRE(out == Bytes{0xC7, 0x03, 0xFF, 0x01, 0x02, 0x03});
    }

    SECTION("ext 8 with empty payload") {
        REQUIRE(write_ext_header(sink, 1, 0) == Error::Ok);
        REQUIRE(out == Bytes{0xC7, 0x00, 0x01});
    }

    SECTION("ext 16 and ext 32") {
        REQUIRE(write_ext_header(sink, 2, 300) == Error::Ok);
        REQUIRE(out == Bytes{0xC8, 0x01, 0x2C, 0x02});
        out.clear();
        REQUIRE(write_ext_header(sink, 3, 65536) == Error::Ok);
        REQUIRE(out == Bytes{0xC9, 0x00, 0x01, 0x00, 0x00, 0x03});
    }
}

TEST_CASE("generic value writer", "[encoder][value]") {
    SECTION("array of ints") {
        REQUIRE(encode_value(Value(Array{5, 10, 20, 200})) ==
                Bytes{0x94, 0x05, 0x0A, 0x14, 0xCC, 0xC8});
    }

    SECTION("map writes key then value") {
        Map m;
        m.insert("compact", true);
        m.insert("schema", 0);
        REQUIRE(encode_value(Value(m)) == Bytes{0x82, 0xA7, 0x63, 0x6F, 0x6D, 0x70, 0x61, 0x63,
                                                0x74, 0xC3, 0xA6, 0x73, 0x63, 0x68, 0x65, 0x6D,
                                                0x61, 0x00});
    }

    SECTION("nested containers depth-first") {
        Value v(Array{Array{1}, Map{{2, Array{}}}});
        REQUIRE(encode_value(v) == Bytes{0x92, 0x91, 0x01, 0x81, 0x02, 0x90});
    }

    SECTION("end-of-input sentinel is unsupported") {
        Bytes out;
        VectorSink sink(out);
        REQUIRE(write_value(sink, Value::end_of_input()) == Error::UnsupportedValue);
        REQUIRE(out.empty());
    }

    SECTION("large unsigned Value encodes signed, native writer encodes uint 64") {
        constexpr auto big = std::numeric_limits<std::uint64_t>::max();
        REQUIRE(encode_value(Value(big)) == Bytes{0xFF});

        Bytes out;
        VectorSink sink(out);
        REQUIRE(write(sink, big) == Error::Ok);
        REQUIRE(out == Bytes{0xCF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
    }

    SECTION("unsupported value inside a container fails the whole write") {
        Bytes out;
        VectorSink sink(out);
        REQUIRE(write_value(sink, Value(Array{1, Value::end_of_input()})) ==
                Error::UnsupportedValue);
    }
}

TEST_CASE("native type writers", "[encoder][native]") {
    Bytes out;
    VectorSink sink(out);

    SECTION("scalars") {
        REQUIRE(write(sink, nullptr) == Error::Ok);
        REQUIRE(write(sink, true) == Error::Ok);
        REQUIRE(write(sink, std::int8_t{-1}) == Error::Ok);
        REQUIRE(write(sink, std::uint16_t{200}) == Error::Ok);
        REQUIRE(write(sink, 1.5F) == Error::Ok);
        REQUIRE(out == Bytes{0xC0, 0xC3, 0xFF, 0xCC, 0xC8, 0xCA, 0x3F, 0xC0, 0x00, 0x00});
    }

    SECTION("double is always float 64") {
        REQUIRE(write(sink, 1.5) == Error::Ok);
        REQUIRE(out.size() == 9);
        REQUIRE(out[0] == 0xCB);
    }

    SECTION("strings") {
        REQUIRE(write(sink, "ab") == Error::Ok);
        REQUIRE(write(sink, std::string("c")) == Error::Ok);
        REQUIRE(out == Bytes{0xA2, 0x61, 0x62, 0xA1, 0x63});
    }

    SECTION("byte vector is binary") {
        REQUIRE(write(sink, Binary{0x01}) == Error::Ok);
        REQUIRE(out == Bytes{0xC4, 0x01, 0x01});
    }

    SECTION("vector of ints is an array") {
        REQUIRE(write(sink, std::vector<int>{5, 10, 20, 200}) == Error::Ok);
        REQUIRE(out == Bytes{0x94, 0x05, 0x0A, 0x14, 0xCC, 0xC8});
    }

    SECTION("std::map") {
        REQUIRE(write(sink, std::map<int, std::string>{{0, "schema"}}) == Error::Ok);
        REQUIRE(out == Bytes{0x81, 0x00, 0xA6, 0x73, 0x63, 0x68, 0x65, 0x6D, 0x61});
    }

    SECTION("optional") {
        REQUIRE(write(sink, std::optional<int>{}) == Error::Ok);
        REQUIRE(write(sink, std::optional<int>{3}) == Error::Ok);
        REQUIRE(out == Bytes{0xC0, 0x03});
    }

    SECTION("nested native containers") {
        std::vector<std::vector<int>> nested = {{1}, {}};
        REQUIRE(write(sink, nested) == Error::Ok);
        REQUIRE(out == Bytes{0x92, 0x91, 0x01, 0x90});
    }
}
