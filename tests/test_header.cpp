#include "archive_builder.hpp"

#include <dspack/header.hpp>

#include <gtest/gtest.h>

using namespace dspack;
using dspack::test::ArchiveBuilder;

class HeaderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> build_sample(ByteOrder order) {
        ArchiveBuilder builder(order);
        int32_t data = builder.add_folder("Data", NO_INDEX, 0, 1);
        builder.add_stored_file("a.txt", data, dspack::test::bytes_of("hello"));
        builder.add_stored_file("b.bin", data, {1, 2, 3});
        auto bytes = builder.build();
        file_dir_offset_ = builder.file_dir_offset();
        folder_dir_offset_ = builder.folder_dir_offset();
        names_offset_ = builder.names_offset();
        return bytes;
    }

    uint32_t file_dir_offset_ = 0;
    uint32_t folder_dir_offset_ = 0;
    uint32_t names_offset_ = 0;
};

TEST_F(HeaderTest, ParsesLittleEndian) {
    auto bytes = build_sample(ByteOrder::Little);

    auto header = parse_header(bytes, bytes.size());
    ASSERT_TRUE(header) << header.error().full_message();
    EXPECT_EQ(header->byte_order, ByteOrder::Little);
    EXPECT_EQ(header->num_files, 2u);
    EXPECT_EQ(header->num_folders, 1u);
    EXPECT_EQ(header->file_dir_offset, file_dir_offset_);
    EXPECT_EQ(header->folder_dir_offset, folder_dir_offset_);
    EXPECT_EQ(header->names_dir_offset, names_offset_);
    EXPECT_EQ(header->file_dir_length, 2 * FILE_RECORD_SIZE);
}

TEST_F(HeaderTest, ParsesBigEndian) {
    auto bytes = build_sample(ByteOrder::Big);

    auto header = parse_header(bytes, bytes.size());
    ASSERT_TRUE(header) << header.error().full_message();
    EXPECT_EQ(header->byte_order, ByteOrder::Big);
    EXPECT_EQ(header->num_files, 2u);
    EXPECT_EQ(header->num_folders, 1u);
    EXPECT_EQ(header->folder_dir_offset, folder_dir_offset_);
}

TEST_F(HeaderTest, EverySingleBitFlipOfMagicIsRejected) {
    for (ByteOrder order : {ByteOrder::Little, ByteOrder::Big}) {
        auto bytes = build_sample(order);
        for (size_t byte = 0; byte < 8; ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                auto corrupted = bytes;
                corrupted[byte] ^= static_cast<uint8_t>(1u << bit);

                auto header = parse_header(corrupted, corrupted.size());
                ASSERT_FALSE(header) << "byte " << byte << " bit " << bit;
                EXPECT_EQ(header.error().code, Error::Code::InvalidFormat);
            }
        }
    }
}

TEST_F(HeaderTest, TooSmallIsRejected) {
    auto bytes = build_sample(ByteOrder::Little);

    std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + 20);
    auto header = parse_header(truncated, truncated.size());
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, Error::Code::InvalidFormat);

    std::vector<uint8_t> tiny(bytes.begin(), bytes.begin() + 4);
    EXPECT_FALSE(parse_header(tiny, tiny.size()));
}

TEST_F(HeaderTest, CountAboveCeilingIsRejected) {
    ArchiveBuilder builder;
    auto bytes = builder.build();

    builder.put_u32(bytes, 12, MAX_ENTRY_COUNT + 1);
    auto files = parse_header(bytes, bytes.size());
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::Integrity);

    bytes = builder.build();
    builder.put_u32(bytes, 24, 200000);
    auto folders = parse_header(bytes, bytes.size());
    ASSERT_FALSE(folders);
    EXPECT_EQ(folders.error().code, Error::Code::Integrity);
}

TEST_F(HeaderTest, OffsetOutsideFileIsRejected) {
    auto bytes = build_sample(ByteOrder::Little);
    ArchiveBuilder patcher;

    // file_dir_offset, folder_dir_offset, names_dir_offset
    for (size_t field : {20u, 32u, 40u}) {
        auto corrupted = bytes;
        patcher.put_u32(corrupted, field, static_cast<uint32_t>(bytes.size()));

        auto header = parse_header(corrupted, corrupted.size());
        ASSERT_FALSE(header) << "field at " << field;
        EXPECT_EQ(header.error().code, Error::Code::OutOfBounds);
    }
}

TEST_F(HeaderTest, DirectoryRunningPastEndIsRejected) {
    auto bytes = build_sample(ByteOrder::Little);
    ArchiveBuilder patcher;

    // Two records declared as fifty: the region no longer fits
    patcher.put_u32(bytes, 12, 50);
    auto header = parse_header(bytes, bytes.size());
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, Error::Code::OutOfBounds);
}

TEST_F(HeaderTest, EmptyArchiveIsValid) {
    ArchiveBuilder builder;
    auto bytes = builder.build();

    auto header = parse_header(bytes, bytes.size());
    ASSERT_TRUE(header) << header.error().full_message();
    EXPECT_EQ(header->num_files, 0u);
    EXPECT_EQ(header->num_folders, 0u);
}
