// =============================================================================
// qpx - Block Record Decoder Tests
// =============================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "qpx/codec/quicklz_codec.h"
#include "qpx/format/block_decoder.h"
#include "qpx/pipeline/block_task.h"
#include "support/archive_builder.h"

namespace qpx::format::test {

using qpx::test::ArchiveBuilder;
using qpx::test::bytesOf;
using qpx::test::fromHex;
using qpx::test::literalPacket;
using qpx::test::storedPacket;
using qpx::test::stringOf;

namespace {

constexpr std::size_t kHeaderBytes = 16;

/// @brief Archive bytes after the archive header, positioned past the 'N'.
std::istringstream blockStream(const ArchiveBuilder& builder) {
    std::istringstream in(builder.str().substr(kHeaderBytes + 1));
    return in;
}

}  // namespace

TEST(ChecksumTest, Adler32OfReferencePackets) {
    EXPECT_EQ(computeChecksum(literalPacket("hello")), 0x0d2502ebU);
    EXPECT_EQ(computeChecksum(literalPacket("there")), 0x0d5a02efU);
    EXPECT_EQ(computeChecksum(ByteSpan{}), 1U);
}

TEST(ReadDataBlockTest, ParsesRecord) {
    ArchiveBuilder builder;
    builder.rawBlock(literalPacket("hello"));
    auto in = blockStream(builder);
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    const DataBlock block = readDataBlock(reader, codec, 4);
    EXPECT_EQ(block.index, 4U);
    EXPECT_EQ(block.checksum, 0x0d2502ebU);
    EXPECT_EQ(block.headerSize, 3U);
    EXPECT_EQ(block.compressedSize(), 12U);
    EXPECT_EQ(block.decompressedSize, 5U);
    EXPECT_EQ(block.packet, literalPacket("hello"));
    EXPECT_EQ(block.payload().size(), 9U);
    EXPECT_TRUE(verifyChecksum(block).has_value());
}

TEST(ReadDataBlockTest, LongHeaderPacket) {
    const std::string data(1000, 'q');
    ArchiveBuilder builder;
    builder.block(data);
    auto in = blockStream(builder);
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    const DataBlock block = readDataBlock(reader, codec, 0);
    EXPECT_EQ(block.headerSize, 9U);
    EXPECT_EQ(block.decompressedSize, 1000U);
    EXPECT_EQ(block.packet, storedPacket(data));
}

TEST(ReadDataBlockTest, BadStarterTailIsFormatError) {
    std::istringstream in(std::string("EWBNEWX") + std::string(40, '\0'));
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    try {
        (void)readDataBlock(reader, codec, 2);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->blockIndex, 2U);
    }
}

TEST(ReadDataBlockTest, TruncatedPayloadIsFormatError) {
    ArchiveBuilder builder;
    builder.rawBlock(literalPacket("hello"));
    std::string bytes = builder.str().substr(kHeaderBytes + 1);
    bytes.resize(bytes.size() - 2);
    std::istringstream in(bytes);
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    EXPECT_THROW((void)readDataBlock(reader, codec, 0), FormatError);
}

TEST(ReadDataBlockTest, ImpossibleCodecHeaderIsFormatError) {
    ArchiveBuilder builder;
    builder.rawBlock(qpx::test::fromHex({0x45, 0x01, 0x05}), 0);
    auto in = blockStream(builder);
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    EXPECT_THROW((void)readDataBlock(reader, codec, 0), FormatError);
}

TEST(ReadFileTrailerTest, ParsesTrailer) {
    ArchiveBuilder builder;
    builder.endFile();
    auto in = blockStream(builder);
    io::ByteReader reader(in);

    EXPECT_NO_THROW((void)readFileTrailer(reader));
    EXPECT_EQ(reader.position(), 15U);
}

TEST(ReadFileTrailerTest, BadTailIsFormatError) {
    std::istringstream in(std::string("NDSENDX") + std::string(8, '\0'));
    io::ByteReader reader(in);

    EXPECT_THROW((void)readFileTrailer(reader), FormatError);
}

TEST(VerifyChecksumTest, MismatchReportsBothValues) {
    DataBlock block;
    block.index = 7;
    block.packet = literalPacket("hello");
    block.checksum = 0x12345678;

    auto result = verifyChecksum(block);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChecksumError);
    EXPECT_NE(result.error().message().find("0x12345678"), std::string::npos);
    EXPECT_NE(result.error().message().find("0x0d2502eb"), std::string::npos);
}

TEST(ReadDataBlockTest, TruncatedPayloadWithHugeDeclaredSizeIsFormatError) {
    // Declares a 0xfffffff0-byte stored packet but carries five bytes.
    ArchiveBuilder builder;
    builder.rawBlock(fromHex({0x46, 0xf0, 0xff, 0xff, 0xff, 0x05, 0x00, 0x00, 0x00, 'h', 'e',
                              'l', 'l', 'o'}));
    auto in = blockStream(builder);
    io::ByteReader reader(in);
    const codec::QuickLZCodec codec;

    EXPECT_THROW((void)readDataBlock(reader, codec, 0), FormatError);
}

// =============================================================================
// Block Decompression
// =============================================================================

class DecompressBlockTest : public ::testing::Test {
protected:
    DecompressBlockTest() {
        block_.index = 1;
        block_.packet = literalPacket("hello");
        block_.headerSize = 3;
        block_.decompressedSize = 5;
        block_.checksum = 0xdeadbeef;
    }

    codec::QuickLZCodec codec_;
    DataBlock block_;
    ByteBuffer out_;
};

TEST_F(DecompressBlockTest, IgnorePolicySkipsChecksum) {
    auto result = pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kIgnore, "c.txt", out_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(stringOf(out_), "hello");
}

TEST_F(DecompressBlockTest, WarnPolicyStillDecodes) {
    auto result = pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kWarn, "c.txt", out_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(stringOf(out_), "hello");
}

TEST_F(DecompressBlockTest, VerifyPolicyFailsWithFileAndBlock) {
    auto result =
        pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kVerify, "c.txt", out_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChecksumError);
    EXPECT_NE(result.error().message().find("file: c.txt"), std::string::npos);
    EXPECT_NE(result.error().message().find("block: 1"), std::string::npos);
}

TEST_F(DecompressBlockTest, ForgedStoredSizeIsRejectedBeforeAllocating) {
    block_.packet = fromHex({0x46, 0x0c, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff, 'a', 'b', 'c'});
    block_.headerSize = 9;
    block_.decompressedSize = 0xffffffffU;

    auto result = pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kIgnore, "c.txt", out_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
    EXPECT_EQ(out_.capacity(), 0U);
}

TEST_F(DecompressBlockTest, ImpossibleExpansionIsRejectedBeforeAllocating) {
    // Four payload bytes cannot produce 256 MiB.
    block_.packet = fromHex({0x47, 0x0d, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00,
                             0x00, 0x80});
    block_.headerSize = 9;
    block_.decompressedSize = 0x10000000U;

    auto result = pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kIgnore, "c.txt", out_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
    EXPECT_EQ(out_.capacity(), 0U);
}

TEST_F(DecompressBlockTest, BlockSizeMustMatchPacketHeader) {
    block_.decompressedSize = 6;

    auto result = pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kIgnore, "c.txt", out_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
}

TEST_F(DecompressBlockTest, VerifyPolicyPassesCorrectChecksum) {
    block_.checksum = computeChecksum(block_.packet);
    auto result =
        pipeline::decompressBlock(codec_, block_, ChecksumPolicy::kVerify, "c.txt", out_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(out_, bytesOf("hello"));
}

}  // namespace qpx::format::test
