/**
 * @file test_bitview.cpp
 * @brief Unit tests for BitView class.
 */

#include <catch2/catch_test_macros.hpp>
#include <bitcodec/bitview.hpp>

#include <cstdint>
#include <vector>

using namespace bitcodec;

TEST_CASE("BitView construction", "[bitview]") {
    std::vector<std::uint8_t> buffer = {0x01, 0x02, 0x03, 0x04};

    SECTION("whole buffer") {
        BitView view(buffer);
        REQUIRE(view.valid());
        REQUIRE(view.byte_length() == 4);
        REQUIRE(view.bit_length() == 32);
        REQUIRE_FALSE(view.big_endian());
        REQUIRE(view.data() == buffer.data());
    }

    SECTION("offset and length") {
        BitView view(buffer.data(), buffer.size(), 1, 2);
        REQUIRE(view.byte_length() == 2);
        REQUIRE(view.data() == buffer.data() + 1);

        std::uint8_t value = 0;
        REQUIRE(view.get_uint8(0, value) == Error::Ok);
        REQUIRE(value == 0x02);
    }

    SECTION("offset to end of buffer") {
        BitView view(buffer, 3);
        REQUIRE(view.byte_length() == 1);
    }

    SECTION("default view is empty") {
        BitView view;
        REQUIRE(view.valid());
        REQUIRE(view.bit_length() == 0);
    }

    SECTION("range past the buffer is rejected") {
        REQUIRE_THROWS_AS(BitView(buffer.data(), buffer.size(), 3, 2), InvalidArgumentException);
        REQUIRE_THROWS_AS(BitView(buffer.data(), buffer.size(), 5), InvalidArgumentException);
    }

    SECTION("null storage is rejected") {
        REQUIRE_THROWS_AS(BitView(nullptr, 4), InvalidArgumentException);
    }
}

TEST_CASE("BitView get_bits nibble ordering", "[bitview]") {
    std::uint8_t data[] = {0xB2, 0x00, 0x00}; // 1011 0010
    BitView view(data, sizeof(data));
    std::uint32_t value = 0;

    SECTION("big-endian reads the high nibble first") {
        view.set_big_endian(true);
        REQUIRE(view.get_bits(0, 4, value) == Error::Ok);
        REQUIRE(value == 0xB);
    }

    SECTION("little-endian reads the low nibble first") {
        REQUIRE(view.get_bits(0, 4, value) == Error::Ok);
        REQUIRE(value == 0x2);
    }
}

TEST_CASE("BitView multi-byte byte order", "[bitview]") {
    std::uint8_t data[2] = {0, 0};
    BitView view(data, sizeof(data));
    std::uint32_t value = 0;

    SECTION("big-endian stores most significant byte first") {
        view.set_big_endian(true);
        REQUIRE(view.set_bits(0, 0x0102, 16) == Error::Ok);
        REQUIRE(data[0] == 0x01);
        REQUIRE(data[1] == 0x02);
    }

    SECTION("little-endian stores least significant byte first") {
        REQUIRE(view.set_bits(0, 0x0102, 16) == Error::Ok);
        REQUIRE(data[0] == 0x02);
        REQUIRE(data[1] == 0x01);
    }

    SECTION("switching mode between write and read swaps bytes") {
        REQUIRE(view.set_bits(0, 0x0102, 16) == Error::Ok);
        view.set_big_endian(true);
        REQUIRE(view.get_bits(0, 16, value) == Error::Ok);
        REQUIRE(value == 0x0201);
    }
}

TEST_CASE("BitView unaligned set_bits", "[bitview]") {
    std::uint8_t data[3] = {0, 0, 0};
    BitView view(data, sizeof(data));
    std::uint32_t value = 0;

    SECTION("big-endian 12 bits at offset 4") {
        view.set_big_endian(true);
        REQUIRE(view.set_bits(4, 0xABC, 12) == Error::Ok);
        REQUIRE(data[0] == 0x0A);
        REQUIRE(data[1] == 0xBC);
        REQUIRE(data[2] == 0x00);

        REQUIRE(view.get_bits(4, 12, value) == Error::Ok);
        REQUIRE(value == 0xABC);
    }

    SECTION("little-endian 12 bits at offset 4") {
        REQUIRE(view.set_bits(4, 0xABC, 12) == Error::Ok);
        REQUIRE(data[0] == 0xC0);
        REQUIRE(data[1] == 0xAB);
        REQUIRE(data[2] == 0x00);

        REQUIRE(view.get_bits(4, 12, value) == Error::Ok);
        REQUIRE(value == 0xABC);
    }
}

TEST_CASE("BitView set_bits preserves neighbouring bits", "[bitview]") {
    std::uint8_t data[2] = {0xFF, 0xFF};
    BitView view(data, sizeof(data));

    SECTION("big-endian clears the low five bits") {
        view.set_big_endian(true);
        REQUIRE(view.set_bits(3, 0, 5) == Error::Ok);
        REQUIRE(data[0] == 0xE0);
        REQUIRE(data[1] == 0xFF);
    }

    SECTION("little-endian clears the high five bits") {
        REQUIRE(view.set_bits(3, 0, 5) == Error::Ok);
        REQUIRE(data[0] == 0x07);
        REQUIRE(data[1] == 0xFF);
    }

    SECTION("value bits above the width are ignored") {
        REQUIRE(view.set_bits(0, 0xFFFFFF00U, 8) == Error::Ok);
        REQUIRE(data[0] == 0x00);
        REQUIRE(data[1] == 0xFF);
    }
}

TEST_CASE("BitView round trip over widths and offsets", "[bitview]") {
    std::uint8_t data[8] = {0};
    BitView view(data, sizeof(data));

    for (bool big_endian : {false, true}) {
        view.set_big_endian(big_endian);

        for (std::size_t width = 1; width <= 32; ++width) {
            std::uint32_t mask = (width == 32) ? 0xFFFFFFFFU : ((1U << width) - 1U);
            std::int64_t min_signed = -(std::int64_t{1} << (width - 1));
            std::int64_t max_signed = (std::int64_t{1} << (width - 1)) - 1;

            for (std::size_t offset = 0; offset < 10; ++offset) {
                for (std::uint32_t expected : {0U, mask, 0xA5A5A5A5U & mask}) {
                    std::uint32_t value = 0;
                    REQUIRE(view.set_bits(offset, expected, width) == Error::Ok);
                    REQUIRE(view.get_bits(offset, width, value) == Error::Ok);
                    REQUIRE(value == expected);
                }

                for (std::int64_t expected : {min_signed, std::int64_t{-1}, max_signed}) {
                    std::uint32_t raw = 0;
                    REQUIRE(view.set_bits(offset, static_cast<std::uint32_t>(expected), width) ==
                            Error::Ok);
                    REQUIRE(view.get_bits(offset, width, raw, true) == Error::Ok);
                    REQUIRE(static_cast<std::int32_t>(raw) == expected);
                }
            }
        }
    }
}

TEST_CASE("BitView sign extension", "[bitview]") {
    std::uint8_t data[4] = {0x0F, 0x80, 0xFE, 0xFF};
    BitView view(data, sizeof(data));
    std::uint32_t raw = 0;

    SECTION("narrow signed value") {
        REQUIRE(view.get_bits(0, 4, raw, true) == Error::Ok);
        REQUIRE(static_cast<std::int32_t>(raw) == -1);
    }

    SECTION("narrow unsigned value is not extended") {
        REQUIRE(view.get_bits(0, 4, raw) == Error::Ok);
        REQUIRE(raw == 0xF);
    }

    SECTION("positive value stays positive") {
        REQUIRE(view.get_bits(0, 5, raw, true) == Error::Ok);
        REQUIRE(static_cast<std::int32_t>(raw) == 15);
    }

    SECTION("typed accessors") {
        std::int8_t i8 = 0;
        REQUIRE(view.get_int8(8, i8) == Error::Ok);
        REQUIRE(i8 == -128);

        std::uint8_t u8 = 0;
        REQUIRE(view.get_uint8(8, u8) == Error::Ok);
        REQUIRE(u8 == 0x80);

        std::int16_t i16 = 0;
        REQUIRE(view.get_int16(16, i16) == Error::Ok);
        REQUIRE(i16 == -2);

        std::uint16_t u16 = 0;
        REQUIRE(view.get_uint16(16, u16) == Error::Ok);
        REQUIRE(u16 == 0xFFFE);
    }
}

TEST_CASE("BitView 32-bit values", "[bitview]") {
    std::uint8_t data[4] = {0};
    BitView view(data, sizeof(data));

    REQUIRE(view.set_int32(0, -2) == Error::Ok);

    std::int32_t i32 = 0;
    REQUIRE(view.get_int32(0, i32) == Error::Ok);
    REQUIRE(i32 == -2);

    std::uint32_t u32 = 0;
    REQUIRE(view.get_uint32(0, u32) == Error::Ok);
    REQUIRE(u32 == 0xFFFFFFFEU);

    REQUIRE(view.set_uint32(0, 0xDEADBEEFU) == Error::Ok);
    REQUIRE(view.get_uint32(0, u32) == Error::Ok);
    REQUIRE(u32 == 0xDEADBEEFU);
}

TEST_CASE("BitView boolean", "[bitview]") {
    std::uint8_t data[1] = {0};
    BitView view(data, sizeof(data));
    bool flag = false;

    REQUIRE(view.set_boolean(5, true) == Error::Ok);
    REQUIRE(data[0] == 0x20);
    REQUIRE(view.get_boolean(5, flag) == Error::Ok);
    REQUIRE(flag);
    REQUIRE(view.get_boolean(4, flag) == Error::Ok);
    REQUIRE_FALSE(flag);
}

TEST_CASE("BitView bounds", "[bitview]") {
    std::uint8_t data[2] = {0x12, 0x34};
    BitView view(data, sizeof(data));
    std::uint32_t value = 0xCAFEU;

    SECTION("read ending exactly at the end") {
        REQUIRE(view.get_bits(8, 8, value) == Error::Ok);
        REQUIRE(value == 0x34);
    }

    SECTION("read crossing the end") {
        REQUIRE(view.get_bits(9, 8, value) == Error::OutOfRange);
        REQUIRE(value == 0xCAFEU);
    }

    SECTION("offset beyond the end") {
        REQUIRE(view.get_bits(40, 1, value) == Error::OutOfRange);
    }

    SECTION("failed write leaves the buffer untouched") {
        REQUIRE(view.set_bits(12, 0xFF, 8) == Error::OutOfRange);
        REQUIRE(data[0] == 0x12);
        REQUIRE(data[1] == 0x34);
    }

    SECTION("width above 32 bits") {
        REQUIRE(view.get_bits(0, 33, value) == Error::InvalidArg);
        REQUIRE(view.set_bits(0, 0, 33) == Error::InvalidArg);
    }

    SECTION("zero width") {
        REQUIRE(view.get_bits(16, 0, value) == Error::Ok);
        REQUIRE(value == 0);
        REQUIRE(view.set_bits(16, 1, 0) == Error::Ok);
    }
}

TEST_CASE("BitView floats", "[bitview]") {
    std::uint8_t data[12] = {0};
    BitView view(data, sizeof(data));

    SECTION("float32 round trip at unaligned offset") {
        float value = 0.0F;
        REQUIRE(view.set_float32(3, -1.5F) == Error::Ok);
        REQUIRE(view.get_float32(3, value) == Error::Ok);
        REQUIRE(value == -1.5F);
    }

    SECTION("float64 round trip at unaligned offset") {
        for (bool big_endian : {false, true}) {
            view.set_big_endian(big_endian);
            double value = 0.0;
            REQUIRE(view.set_float64(5, 3.141592653589793) == Error::Ok);
            REQUIRE(view.get_float64(5, value) == Error::Ok);
            REQUIRE(value == 3.141592653589793);
        }
    }

    SECTION("float64 needs all 64 bits") {
        REQUIRE(view.set_float64(40, 1.0) == Error::OutOfRange);
        for (std::uint8_t byte : data) {
            REQUIRE(byte == 0);
        }

        double value = 0.0;
        REQUIRE(view.get_float64(33, value) == Error::OutOfRange);
    }
}

TEST_CASE("BitView get_array_buffer", "[bitview]") {
    std::uint8_t data[3] = {0x12, 0x34, 0x56};
    BitView view(data, sizeof(data));
    std::vector<std::uint8_t> bytes;

    SECTION("aligned copy") {
        REQUIRE(view.get_array_buffer(0, 3, bytes) == Error::Ok);
        REQUIRE(bytes == std::vector<std::uint8_t>{0x12, 0x34, 0x56});

        // The copy is independent of the source
        bytes[0] = 0xFF;
        REQUIRE(data[0] == 0x12);
    }

    SECTION("unaligned big-endian copy") {
        view.set_big_endian(true);
        REQUIRE(view.get_array_buffer(4, 2, bytes) == Error::Ok);
        REQUIRE(bytes == std::vector<std::uint8_t>{0x23, 0x45});
    }

    SECTION("unaligned little-endian copy") {
        REQUIRE(view.get_array_buffer(4, 2, bytes) == Error::Ok);
        REQUIRE(bytes == std::vector<std::uint8_t>{0x41, 0x63});
    }

    SECTION("copy past the end") {
        bytes = {0xAA};
        REQUIRE(view.get_array_buffer(8, 3, bytes) == Error::OutOfRange);
        REQUIRE(bytes == std::vector<std::uint8_t>{0xAA});
    }
}
