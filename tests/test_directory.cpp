#include "archive_builder.hpp"

#include <dspack/directory.hpp>

#include <gtest/gtest.h>

using namespace dspack;
using dspack::test::ArchiveBuilder;
using dspack::test::bytes_of;

class DirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        int32_t data = builder_.add_folder("Data", NO_INDEX, 0, 1);
        builder_.add_folder("Textures", data, 2, 2);
        builder_.add_stored_file("readme.txt", data, bytes_of("hello"));
        builder_.add_file("big.bin", data, {0x01, 'x'}, 20, 0xCAFE);
        builder_.add_file("empty.dat", 1, {}, 0);
        bytes_ = builder_.build();
    }

    Result<std::vector<FileEntry>> read_files() {
        return read_file_entries(file_records(), ByteOrder::Little, names(), limits());
    }

    Result<std::vector<FolderEntry>> read_folders() {
        return read_folder_entries(folder_records(), ByteOrder::Little, names(), limits());
    }

    std::span<const uint8_t> file_records() const {
        return std::span<const uint8_t>(bytes_).subspan(builder_.file_dir_offset(),
                                                        builder_.files().size() * FILE_RECORD_SIZE);
    }

    std::span<const uint8_t> folder_records() const {
        return std::span<const uint8_t>(bytes_).subspan(builder_.folder_dir_offset(),
                                                        builder_.folders().size() * FOLDER_RECORD_SIZE);
    }

    NameTable names() const {
        auto first = bytes_.begin() + builder_.names_offset();
        return NameTable(std::vector<uint8_t>(first, first + builder_.names_length()));
    }

    DirectoryLimits limits() const {
        DirectoryLimits limits;
        limits.num_files = static_cast<uint32_t>(builder_.files().size());
        limits.num_folders = static_cast<uint32_t>(builder_.folders().size());
        limits.file_size = bytes_.size();
        return limits;
    }

    ArchiveBuilder builder_;
    std::vector<uint8_t> bytes_;
};

TEST_F(DirectoryTest, DecodesFileRecords) {
    auto files = read_files();
    ASSERT_TRUE(files) << files.error().full_message();
    ASSERT_EQ(files->size(), 3u);

    const FileEntry& readme = (*files)[0];
    EXPECT_EQ(readme.name, "readme.txt");
    EXPECT_EQ(readme.parent_folder, 0);
    EXPECT_EQ(readme.decompressed_size, 5u);
    EXPECT_EQ(readme.compressed_size, 5u);
    EXPECT_EQ(readme.data_offset, HEADER_SIZE);
    EXPECT_EQ(readme.kind(), PayloadKind::Stored);

    const FileEntry& big = (*files)[1];
    EXPECT_EQ(big.unknown, 0xCAFEu);
    EXPECT_EQ(big.kind(), PayloadKind::MiniPack);

    EXPECT_EQ((*files)[2].kind(), PayloadKind::Empty);
}

TEST_F(DirectoryTest, DecodesFolderRecords) {
    auto folders = read_folders();
    ASSERT_TRUE(folders) << folders.error().full_message();
    ASSERT_EQ(folders->size(), 2u);

    EXPECT_EQ((*folders)[0].name, "Data");
    EXPECT_TRUE((*folders)[0].is_root());
    EXPECT_EQ((*folders)[0].declared_file_count(), 2u);

    EXPECT_EQ((*folders)[1].name, "Textures");
    EXPECT_EQ((*folders)[1].parent_folder, 0);
    EXPECT_EQ((*folders)[1].declared_file_count(), 1u);
}

TEST_F(DirectoryTest, FileWithBadParentIsRejected) {
    builder_.patch_file_field(bytes_, 1, 1, 2);   // Only folders 0 and 1 exist

    auto files = read_files();
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, FileWithNegativeParentOtherThanNoIndexIsRejected) {
    builder_.patch_file_field(bytes_, 0, 1, static_cast<uint32_t>(-2));

    auto files = read_files();
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, RootFileIsAccepted) {
    builder_.patch_file_field(bytes_, 0, 1, static_cast<uint32_t>(NO_INDEX));

    auto files = read_files();
    ASSERT_TRUE(files) << files.error().full_message();
    EXPECT_TRUE((*files)[0].is_root());
}

TEST_F(DirectoryTest, FolderWithBadFileRangeIsRejected) {
    builder_.patch_folder_field(bytes_, 0, 5, 4);   // last_file past num_files

    auto folders = read_folders();
    ASSERT_FALSE(folders);
    EXPECT_EQ(folders.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, FolderRangeMayEndOnePastLastFile) {
    builder_.patch_folder_field(bytes_, 1, 5, 3);

    auto folders = read_folders();
    ASSERT_TRUE(folders) << folders.error().full_message();
}

TEST_F(DirectoryTest, FolderWithBadParentIsRejected) {
    builder_.patch_folder_field(bytes_, 1, 1, 7);

    auto folders = read_folders();
    ASSERT_FALSE(folders);
    EXPECT_EQ(folders.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, NameOutsideTableIsRejected) {
    builder_.patch_file_field(bytes_, 2, 0, builder_.names_length() + 10);

    auto files = read_files();
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, EmptyNameIsRejected) {
    // The last byte of the table is the terminator of the last folder name
    builder_.patch_folder_field(bytes_, 1, 0, builder_.names_length() - 1);

    auto folders = read_folders();
    ASSERT_FALSE(folders);
    EXPECT_EQ(folders.error().code, Error::Code::Integrity);
}

TEST_F(DirectoryTest, CompressedSizeLargerThanFileIsRejected) {
    builder_.patch_file_field(bytes_, 0, 3, static_cast<uint32_t>(bytes_.size() + 1));

    auto files = read_files();
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::OutOfBounds);
}

TEST_F(DirectoryTest, DataOffsetOutsideFileIsRejected) {
    builder_.patch_file_field(bytes_, 0, 5, static_cast<uint32_t>(bytes_.size()));

    auto files = read_files();
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, Error::Code::OutOfBounds);
}

TEST_F(DirectoryTest, BigEndianRecordsDecode) {
    ArchiveBuilder builder(ByteOrder::Big);
    builder.add_folder("Root", NO_INDEX, 0, 0);
    builder.add_stored_file("a", 0, bytes_of("xyz"));
    auto bytes = builder.build();

    auto first = bytes.begin() + builder.names_offset();
    NameTable names(std::vector<uint8_t>(first, first + builder.names_length()));

    DirectoryLimits limits;
    limits.num_files = 1;
    limits.num_folders = 1;
    limits.file_size = bytes.size();

    auto files = read_file_entries(std::span<const uint8_t>(bytes).subspan(builder.file_dir_offset(), FILE_RECORD_SIZE),
                                   ByteOrder::Big, names, limits);
    ASSERT_TRUE(files) << files.error().full_message();
    EXPECT_EQ((*files)[0].name, "a");
    EXPECT_EQ((*files)[0].compressed_size, 3u);
    EXPECT_EQ((*files)[0].data_offset, HEADER_SIZE);
}
