// =============================================================================
// qpx - QuickLZ Codec Tests
// =============================================================================
// Unit tests for header parsing and level-1 decompression, plus properties
// checking that arbitrary packets are either decoded or rejected cleanly.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "qpx/codec/quicklz_codec.h"
#include "support/archive_builder.h"
#include "support/quicklz_fixtures.h"

namespace qpx::codec::test {

using qpx::test::bytesOf;
using qpx::test::fromHex;
using qpx::test::kGreeting;
using qpx::test::kGreetingPacket;
using qpx::test::kNoisePacket;
using qpx::test::kTextPacket;
using qpx::test::kZeroPagePacket;
using qpx::test::noiseBytes;
using qpx::test::textLines;
using qpx::test::literalPacket;
using qpx::test::storedPacket;
using qpx::test::stringOf;

namespace {

/// @brief "abcd" as literals, a 12-byte back-reference to hash slot 0x457,
///        then "efgh" from the literal tail.
ByteBuffer matchPacket() {
    return fromHex({0x45, 0x11, 0x14, 0x10, 0x00, 0x00, 0x80, 'a', 'b', 'c', 'd', 0x7a, 0x45,
                    'e', 'f', 'g', 'h'});
}

Result<ByteBuffer> decode(const QuickLZCodec& codec, const ByteBuffer& packet) {
    auto sizes = codec.declaredSizes(ByteSpan(packet).first(codec.headerSize(packet[0])));
    if (!sizes) {
        return std::unexpected(sizes.error());
    }
    ByteBuffer out(sizes->decompressedSize);
    auto produced = codec.decompress(packet, out);
    if (!produced) {
        return std::unexpected(produced.error());
    }
    out.resize(*produced);
    return out;
}

}  // namespace

// =============================================================================
// Header Parsing
// =============================================================================

TEST(QuickLZHeaderTest, FlagHelpers) {
    EXPECT_TRUE(quicklz::isCompressed(0x45));
    EXPECT_FALSE(quicklz::isCompressed(0x46));
    EXPECT_EQ(quicklz::levelOf(0x45), 1);
    EXPECT_EQ(quicklz::levelOf(0x4d), 3);
}

TEST(QuickLZHeaderTest, HeaderSizeFollowsLongFlag) {
    const QuickLZCodec codec;
    EXPECT_EQ(codec.headerSize(0x45), 3U);
    EXPECT_EQ(codec.headerSize(0x46), 9U);
    EXPECT_EQ(codec.headerSize(0x47), 9U);
}

TEST(QuickLZHeaderTest, ShortHeaderSizes) {
    const QuickLZCodec codec;
    const auto header = fromHex({0x45, 0x0c, 0x05});
    auto sizes = codec.declaredSizes(header);
    ASSERT_TRUE(sizes.has_value());
    EXPECT_EQ(sizes->compressedSize, 12U);
    EXPECT_EQ(sizes->decompressedSize, 5U);
}

TEST(QuickLZHeaderTest, LongHeaderSizes) {
    const QuickLZCodec codec;
    const auto header = fromHex({0x47, 0x09, 0x01, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00});
    auto sizes = codec.declaredSizes(header);
    ASSERT_TRUE(sizes.has_value());
    EXPECT_EQ(sizes->compressedSize, 0x109U);
    EXPECT_EQ(sizes->decompressedSize, 0x10000U);
}

TEST(QuickLZHeaderTest, CompressedSizeBelowHeaderIsFormatError) {
    const QuickLZCodec codec;
    const auto header = fromHex({0x46, 0x05, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00});
    auto sizes = codec.declaredSizes(header);
    ASSERT_FALSE(sizes.has_value());
    EXPECT_EQ(sizes.error().code(), ErrorCode::kFormatError);
}

TEST(QuickLZHeaderTest, IncompleteHeaderIsFormatError) {
    const QuickLZCodec codec;
    const auto header = fromHex({0x46, 0x05, 0x00});
    EXPECT_FALSE(codec.declaredSizes(header).has_value());
}

// =============================================================================
// Decompression
// =============================================================================

TEST(QuickLZDecompressTest, LiteralTailPacket) {
    const QuickLZCodec codec;
    auto out = decode(codec, literalPacket("hello"));
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(stringOf(*out), "hello");
}

TEST(QuickLZDecompressTest, BackReferenceThroughHashTable) {
    const QuickLZCodec codec;
    auto out = decode(codec, matchPacket());
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(stringOf(*out), "abcdabcdabcdabcdefgh");
}

TEST(QuickLZDecompressTest, StoredLongHeaderPacket) {
    const QuickLZCodec codec;
    const std::string data(300, 'z');
    auto out = decode(codec, storedPacket(data));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(stringOf(*out), data);
}

TEST(QuickLZDecompressTest, StoredShortHeaderPacket) {
    const QuickLZCodec codec;
    auto out = decode(codec, fromHex({0x44, 0x06, 0x03, 'a', 'b', 'c'}));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(stringOf(*out), "abc");
}

TEST(QuickLZDecompressTest, EmptyOutput) {
    const QuickLZCodec codec;
    auto out = decode(codec, literalPacket(""));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}

TEST(QuickLZDecompressTest, UnsupportedLevelFails) {
    const QuickLZCodec codec;
    auto out = decode(codec, fromHex({0x4d, 0x0c, 0x05, 0x00, 0x00, 0x00, 0x80, 'h', 'e', 'l',
                                      'l', 'o'}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code(), ErrorCode::kDecompressionFailed);
    EXPECT_NE(out.error().message().find("level 3"), std::string::npos);
}

TEST(QuickLZDecompressTest, ReferenceToUnsetHashSlotFails) {
    const QuickLZCodec codec;
    auto out = decode(codec, fromHex({0x45, 0x09, 0x14, 0x01, 0x00, 0x00, 0x80, 0x7a, 0x45}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(QuickLZDecompressTest, TruncatedControlWordFails) {
    const QuickLZCodec codec;
    auto out = decode(codec, fromHex({0x45, 0x05, 0x14, 0x00, 0x00}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(QuickLZDecompressTest, TruncatedLiteralTailFails) {
    const QuickLZCodec codec;
    // Declares 8 output bytes but carries only 5.
    auto out = decode(codec, fromHex({0x45, 0x0c, 0x08, 0x00, 0x00, 0x00, 0x80, 'h', 'e', 'l',
                                      'l', 'o'}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(QuickLZDecompressTest, PacketSizeMismatchFails) {
    const QuickLZCodec codec;
    auto packet = literalPacket("hello");
    packet.push_back(0x00);
    ByteBuffer out(5);
    EXPECT_FALSE(codec.decompress(packet, out).has_value());
}

TEST(QuickLZDecompressTest, OutputSizeMismatchFails) {
    const QuickLZCodec codec;
    ByteBuffer out(4);
    EXPECT_FALSE(codec.decompress(literalPacket("hello"), out).has_value());
}

// =============================================================================
// Encoder Output
// =============================================================================

TEST(QuickLZEncoderOutputTest, TextAcrossSeveralControlWords) {
    const QuickLZCodec codec;
    auto sizes = codec.validate(kTextPacket);
    ASSERT_TRUE(sizes.has_value()) << sizes.error().message();
    EXPECT_EQ(sizes->compressedSize, kTextPacket.size());
    EXPECT_EQ(sizes->decompressedSize, 3382U);

    auto out = decode(codec, kTextPacket);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(stringOf(*out), textLines());
}

TEST(QuickLZEncoderOutputTest, ZeroPageOfLongBackReferences) {
    const QuickLZCodec codec;
    auto out = decode(codec, kZeroPagePacket);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(*out, ByteBuffer(4096, 0x00));
}

TEST(QuickLZEncoderOutputTest, ShortHeaderWithMatchesAndLiteralRuns) {
    const QuickLZCodec codec;
    EXPECT_EQ(codec.headerSize(kGreetingPacket[0]), 3U);

    auto out = decode(codec, kGreetingPacket);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(stringOf(*out), kGreeting);
}

TEST(QuickLZEncoderOutputTest, IncompressibleInputIsStored) {
    const QuickLZCodec codec;
    EXPECT_FALSE(quicklz::isCompressed(kNoisePacket[0]));

    auto out = decode(codec, kNoisePacket);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(stringOf(*out), noiseBytes());
}

// =============================================================================
// Packet Validation
// =============================================================================

TEST(QuickLZValidateTest, AcceptsWellFormedPackets) {
    const QuickLZCodec codec;
    EXPECT_TRUE(codec.validate(literalPacket("hello")).has_value());
    EXPECT_TRUE(codec.validate(matchPacket()).has_value());
    EXPECT_TRUE(codec.validate(storedPacket("stored")).has_value());
}

TEST(QuickLZValidateTest, StoredPayloadMustMatchDeclaredSize) {
    const QuickLZCodec codec;
    auto sizes = codec.validate(fromHex({0x44, 0x06, 0x04, 'a', 'b', 'c'}));
    ASSERT_FALSE(sizes.has_value());
    EXPECT_EQ(sizes.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(QuickLZValidateTest, RejectsExpansionNoPacketCanReach) {
    const QuickLZCodec codec;
    // 4 payload bytes declaring 341 output bytes; 340 would still be possible.
    auto sizes = codec.validate(fromHex({0x47, 0x0d, 0x00, 0x00, 0x00, 0x55, 0x01, 0x00, 0x00,
                                         0x00, 0x00, 0x00, 0x80}));
    ASSERT_FALSE(sizes.has_value());
    EXPECT_NE(sizes.error().message().find("cannot expand"), std::string::npos);
}

TEST(QuickLZValidateTest, RejectsUnsupportedLevelAndSizeMismatch) {
    const QuickLZCodec codec;
    EXPECT_FALSE(codec.validate(fromHex({0x4d, 0x0c, 0x05, 0x00, 0x00, 0x00, 0x80, 'h', 'e', 'l',
                                         'l', 'o'}))
                     .has_value());

    auto packet = literalPacket("hello");
    packet.pop_back();
    EXPECT_FALSE(codec.validate(packet).has_value());
}

TEST(BlockCodecFactoryTest, DefaultCodecIsQuickLZ) {
    auto codec = makeDefaultCodec();
    ASSERT_NE(codec, nullptr);
    EXPECT_EQ(codec->name(), "quicklz");
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(QuickLZPropertyTest, ShortLiteralPacketsDecodeToThemselves, ()) {
    const auto text = *rc::gen::container<std::string>(
        *rc::gen::inRange<std::size_t>(0, 11), rc::gen::arbitrary<char>());
    const QuickLZCodec codec;
    auto out = decode(codec, literalPacket(text));
    RC_ASSERT(out.has_value());
    RC_ASSERT(stringOf(*out) == text);
}

RC_GTEST_PROP(QuickLZPropertyTest, StoredPacketsDecodeToThemselves, ()) {
    const auto text = *rc::gen::arbitrary<std::string>();
    const QuickLZCodec codec;
    auto out = decode(codec, storedPacket(text));
    RC_ASSERT(out.has_value());
    RC_ASSERT(stringOf(*out) == text);
}

RC_GTEST_PROP(QuickLZPropertyTest, ArbitraryLevel1PayloadsNeverOverrun, ()) {
    const auto payload = *rc::gen::container<std::vector<std::uint8_t>>(
        *rc::gen::inRange<std::size_t>(0, 200), rc::gen::arbitrary<std::uint8_t>());
    const auto declared = *rc::gen::inRange<std::size_t>(0, 256);

    ByteBuffer packet = {0x45, static_cast<std::uint8_t>(payload.size() + 3),
                         static_cast<std::uint8_t>(declared)};
    packet.insert(packet.end(), payload.begin(), payload.end());

    const QuickLZCodec codec;
    ByteBuffer out(declared);
    auto produced = codec.decompress(packet, out);
    if (produced.has_value()) {
        RC_ASSERT(*produced == declared);
    } else {
        RC_ASSERT(produced.error().code() == ErrorCode::kDecompressionFailed);
    }
}

RC_GTEST_PROP(QuickLZPropertyTest, CorruptedMatchPacketIsDecodedOrRejected, ()) {
    ByteBuffer packet = matchPacket();
    const auto pos = *rc::gen::inRange<std::size_t>(3, packet.size());
    const auto value = *rc::gen::arbitrary<std::uint8_t>();
    packet[pos] = value;

    const QuickLZCodec codec;
    ByteBuffer out(20);
    auto produced = codec.decompress(packet, out);
    if (produced.has_value()) {
        RC_ASSERT(*produced == out.size());
    }
}

RC_GTEST_PROP(QuickLZPropertyTest, CorruptedEncoderOutputIsDecodedOrRejected, ()) {
    ByteBuffer packet = kTextPacket;
    const auto pos = *rc::gen::inRange<std::size_t>(quicklz::kLongHeaderSize, packet.size());
    packet[pos] = *rc::gen::arbitrary<std::uint8_t>();

    const QuickLZCodec codec;
    ByteBuffer out(3382);
    auto produced = codec.decompress(packet, out);
    if (produced.has_value()) {
        RC_ASSERT(*produced == out.size());
    } else {
        RC_ASSERT(produced.error().code() == ErrorCode::kDecompressionFailed);
    }
}

}  // namespace qpx::codec::test
