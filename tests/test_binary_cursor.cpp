#include <dspack/binary_cursor.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace dspack;

TEST(BinaryCursorTest, ReadsLittleAndBigEndian) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x01, 0x02, 0x03, 0x04};
    BinaryCursor cursor(data);

    auto le = cursor.read_u32(ByteOrder::Little);
    ASSERT_TRUE(le);
    EXPECT_EQ(*le, 0x04030201u);

    auto be = cursor.read_u32(ByteOrder::Big);
    ASSERT_TRUE(be);
    EXPECT_EQ(*be, 0x01020304u);

    EXPECT_EQ(cursor.position(), 8u);
    EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(BinaryCursorTest, SignedReadKeepsNoIndex) {
    std::vector<uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF};
    BinaryCursor cursor(data);

    auto value = cursor.read_i32(ByteOrder::Little);
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, NO_INDEX);
}

TEST(BinaryCursorTest, ReadPastEndFails) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    BinaryCursor cursor(data);

    auto value = cursor.read_u32(ByteOrder::Little);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, Error::Code::OutOfBounds);
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(BinaryCursorTest, SeekAndReadBytes) {
    std::vector<uint8_t> data = {'a', 'b', 'c', 'd', 'e'};
    BinaryCursor cursor(data);

    ASSERT_TRUE(cursor.seek(2));
    auto bytes = cursor.read_bytes(3);
    ASSERT_TRUE(bytes);
    EXPECT_EQ(std::string(bytes->begin(), bytes->end()), "cde");

    EXPECT_FALSE(cursor.seek(6));
    EXPECT_FALSE(cursor.read_bytes(1));
    EXPECT_TRUE(cursor.seek(5));
}

TEST(BinaryCursorTest, StoreMatchesLoad) {
    uint8_t buf[4];
    store_u32(buf, 0xDEADBEEF, ByteOrder::Big);
    EXPECT_EQ(buf[0], 0xDE);
    EXPECT_EQ(buf[3], 0xEF);
    EXPECT_EQ(load_u32(buf, ByteOrder::Big), 0xDEADBEEFu);

    store_u32(buf, 0xDEADBEEF, ByteOrder::Little);
    EXPECT_EQ(buf[0], 0xEF);
    EXPECT_EQ(load_u32(buf, ByteOrder::Little), 0xDEADBEEFu);
}
