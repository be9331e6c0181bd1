#include "../src/chunk_reader.hpp"
#include "../src/metadata.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
cas::Metadata metadata_of(const std::vector<uint8_t>& source) {
    return cas::derive_metadata(cas::parse(source));
}

std::string decode(const std::vector<uint8_t>& bytes) {
    return cas::decode_utf8_lossy(bytes);
}
} // namespace

TEST(MetadataTests, EmptyTape) {
    const auto meta = metadata_of({});
    EXPECT_FALSE(meta.description.has_value());
    EXPECT_EQ(meta.baudrate, 600);
    EXPECT_EQ(meta.chunk_count, 0u);
    EXPECT_EQ(meta.data_block_count, 0u);
}

TEST(MetadataTests, TypicalTape) {
    const auto meta = metadata_of(CasBuilder()
        .fuji("Jumpman Junior")
        .baud(600)
        .data(sioRecord(0xFC, 0x01))
        .data(sioRecord(0xFC, 0x02))
        .data(sioRecord(0xFE, 0x00))
        .build());

    ASSERT_TRUE(meta.description.has_value());
    EXPECT_EQ(*meta.description, "Jumpman Junior");
    EXPECT_EQ(meta.baudrate, 600);
    EXPECT_EQ(meta.chunk_count, 5u);
    EXPECT_EQ(meta.data_block_count, 3u);
}

TEST(MetadataTests, DefaultBaudrateWithoutBaudChunk) {
    const auto meta = metadata_of(CasBuilder().fuji("No baud").data({1, 2}).build());
    EXPECT_EQ(meta.baudrate, cas::DEFAULT_BAUDRATE);
}

TEST(MetadataTests, ReadsBaudrateLittleEndian) {
    const auto meta = metadata_of(CasBuilder().chunk("baud", {0xB0, 0x04}).build());
    EXPECT_EQ(meta.baudrate, 1200);
}

TEST(MetadataTests, FirstBaudChunkWins) {
    const auto meta = metadata_of(CasBuilder().baud(800).data({1}).baud(1200).build());
    EXPECT_EQ(meta.baudrate, 800);
}

TEST(MetadataTests, ShortBaudChunkFallsBackToDefault) {
    const auto meta = metadata_of(CasBuilder().chunk("baud", {0x58}).baud(1200).build());
    EXPECT_EQ(meta.baudrate, 600);
}

TEST(MetadataTests, BaudChunkWithExtraBytesUsesFirstTwo) {
    const auto meta = metadata_of(CasBuilder().chunk("baud", {0x20, 0x03, 0xFF, 0xFF}).build());
    EXPECT_EQ(meta.baudrate, 800);
}

TEST(MetadataTests, FirstFujiChunkIsTheDescription) {
    const auto meta = metadata_of(CasBuilder().fuji("Side A").data({1}).fuji("Side B").build());
    ASSERT_TRUE(meta.description.has_value());
    EXPECT_EQ(*meta.description, "Side A");
}

TEST(MetadataTests, EmptyFujiChunkIsAnEmptyDescription) {
    const auto meta = metadata_of(CasBuilder().fuji("").build());
    ASSERT_TRUE(meta.description.has_value());
    EXPECT_EQ(*meta.description, "");
}

TEST(MetadataTests, DescriptionKeepsValidUtf8) {
    const auto meta = metadata_of(CasBuilder().fuji("K\xC3\xA4sekuchen \xE2\x98\x85").build());
    ASSERT_TRUE(meta.description.has_value());
    EXPECT_EQ(*meta.description, "K\xC3\xA4sekuchen \xE2\x98\x85");
}

TEST(MetadataTests, MalformedDescriptionIsRepaired) {
    const auto meta = metadata_of(CasBuilder().chunk("FUJI", {'A', 0xFF, 'B'}).build());
    ASSERT_TRUE(meta.description.has_value());
    EXPECT_EQ(*meta.description, "A\xEF\xBF\xBD" "B");
}

TEST(MetadataTests, TurboBlocksAreNotDataBlocks) {
    const auto meta = metadata_of(CasBuilder()
        .chunk("pwms", {0x01, 0x00, 0x00})
        .chunk("pwmc", {0x10, 0x00})
        .chunk("pwmd", {1, 2, 3, 4})
        .chunk("fsk ", {0x40, 0x00})
        .chunk("XXXX", {5})
        .data({6})
        .build());
    EXPECT_EQ(meta.chunk_count, 6u);
    EXPECT_EQ(meta.data_block_count, 1u);
}

TEST(Utf8DecodeTests, AsciiPassesThrough) {
    EXPECT_EQ(decode(bytesOf("Hello, Atari!")), "Hello, Atari!");
}

TEST(Utf8DecodeTests, StrayContinuationByte) {
    EXPECT_EQ(decode({0x80, 'x'}), "\xEF\xBF\xBDx");
}

TEST(Utf8DecodeTests, TruncatedSequenceIsOneReplacement) {
    // E2 98 is the start of a 3 byte sequence cut short
    EXPECT_EQ(decode({0xE2, 0x98, 'x'}), "\xEF\xBF\xBDx");
    EXPECT_EQ(decode({0xE2, 0x98}), "\xEF\xBF\xBD");
}

TEST(Utf8DecodeTests, OverlongEncodingIsRejected) {
    // C0 AF is an overlong '/'
    EXPECT_EQ(decode({0xC0, 0xAF}), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf8DecodeTests, SurrogatesAreRejected) {
    EXPECT_EQ(decode({0xED, 0xA0, 0x80}), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf8DecodeTests, FourByteSequence) {
    EXPECT_EQ(decode({0xF0, 0x9F, 0x8E, 0xAE}), "\xF0\x9F\x8E\xAE");
    EXPECT_EQ(decode({0xF4, 0x90, 0x80, 0x80}), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
