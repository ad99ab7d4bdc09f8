#include <array>
#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "spanwire/codec/buffer.hpp"

namespace {
    std::string written(const spanwire::codec::u8* data, const spanwire::codec::Buffer& b) {
        return std::string(reinterpret_cast<const char*>(data), b.pos());
    }
} // namespace

TEST(CodecBuffer, WritesPrimitivesInOrder) {
    std::array<spanwire::codec::u8, 32> buf{};
    spanwire::codec::Buffer b({buf.data(), static_cast<spanwire::codec::u32>(buf.size())});

    b.write_byte('{').write_ascii("\"a\":").write_decimal(1234567890123ull).write_byte(',');
    b.write_utf8("\xc3\xa9").write_byte('}');

    EXPECT_FALSE(b.overflowed());
    EXPECT_EQ(written(buf.data(), b), "{\"a\":1234567890123,\xc3\xa9}");
    EXPECT_EQ(b.remaining(), buf.size() - b.pos());
}

TEST(CodecBuffer, DecimalBoundaries) {
    std::array<spanwire::codec::u8, 64> buf{};
    spanwire::codec::Buffer b({buf.data(), static_cast<spanwire::codec::u32>(buf.size())});

    b.write_decimal(0).write_byte(' ').write_decimal(10).write_byte(' ').write_decimal(UINT64_MAX);
    EXPECT_EQ(written(buf.data(), b), "0 10 18446744073709551615");
}

TEST(CodecBuffer, AsciiSizeMatchesDecimalRendering) {
    EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(0), 1u);
    EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(9), 1u);
    EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(UINT64_MAX), spanwire::codec::kMaxDecimalDigits);

    spanwire::codec::u64 v = 1;
    for (int digits = 1; digits <= 19; ++digits) {
        EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(v), static_cast<spanwire::codec::u32>(std::to_string(v).size()));
        EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(v - 1), static_cast<spanwire::codec::u32>(std::to_string(v - 1).size()));
        v *= 10;
    }
    // 10^19
    EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(v), 20u);
    EXPECT_EQ(spanwire::codec::ascii_size_in_bytes(v - 1), 19u);
}

TEST(CodecBuffer, ShortWriteLatchesOverflowAndWritesNothing) {
    std::array<spanwire::codec::u8, 8> buf{};
    buf.fill('#');
    spanwire::codec::Buffer b({buf.data(), 4});

    b.write_ascii("ab");
    ASSERT_FALSE(b.overflowed());
    b.write_ascii("cde");
    EXPECT_TRUE(b.overflowed());
    EXPECT_EQ(b.pos(), 2u);

    // Later writes that would fit are ignored too.
    b.write_byte('z');
    EXPECT_EQ(b.pos(), 2u);

    EXPECT_EQ(buf[2], '#');
    EXPECT_EQ(buf[4], '#');
}

TEST(CodecBuffer, ExactFitDoesNotOverflow) {
    std::array<spanwire::codec::u8, 5> buf{};
    spanwire::codec::Buffer b({buf.data(), static_cast<spanwire::codec::u32>(buf.size())});
    b.write_ascii("12").write_decimal(345);
    EXPECT_FALSE(b.overflowed());
    EXPECT_EQ(b.pos(), 5u);
    EXPECT_EQ(b.remaining(), 0u);
}

TEST(CodecBuffer, NullRegionOverflowsOnFirstByte) {
    spanwire::codec::Buffer b({nullptr, 0});
    b.write_ascii("");
    EXPECT_FALSE(b.overflowed());
    b.write_byte('x');
    EXPECT_TRUE(b.overflowed());
    EXPECT_EQ(b.pos(), 0u);
}
