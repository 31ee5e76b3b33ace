#include "gtest/gtest.h"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/decode_router.hpp"
#include "cogdedup/errors.hpp"
#include "test_utils.hpp"

#include <stdexcept>
#include <vector>

using namespace cogdedup;

TEST(DecodeRouterTest, DetectsFormatFamilies) {
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("UCOG....")),
              FormatFamily::CognitiveDedup);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("TPF3")), FormatFamily::Template);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("USZR")), FormatFamily::RawZstd);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("USZD")),
              FormatFamily::DictionaryZstd);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("USBR")), FormatFamily::RawBrotli);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("USBZ")), FormatFamily::RawBzip2);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("ZZZZ")), FormatFamily::Unknown);
    EXPECT_EQ(DecodeRouter::detect(string_to_byte_vector("US")), FormatFamily::Unknown);
    EXPECT_STREQ(formatFamilyName(FormatFamily::Stream), "stream");
}

TEST(DecodeRouterTest, RoutesUcogToCodec) {
    ChunkStore store;
    SecurityPolicy policy;
    Codec codec;
    auto data = text_bytes(20000, 1);
    EncodeResult result = codec.encode(data, store, policy);
    DecodeRouter router;
    EXPECT_EQ(router.decode(result.envelope, store, policy), data);
}

TEST(DecodeRouterTest, RawZstdFallbackRoundTrip) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    auto data = text_bytes(50000, 2);
    auto blob = DecodeRouter::encodeRawFallback(data, 3);
    EXPECT_TRUE(hasMagic(blob, MAGIC_USZR));
    EXPECT_EQ(router.decode(blob, store, policy), data);

    std::vector<std::byte> empty;
    EXPECT_TRUE(router.decode(DecodeRouter::encodeRawFallback(empty), store, policy).empty());
}

TEST(DecodeRouterTest, DictionaryFallbackRoundTrip) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    auto dict = text_bytes(8192, 3);
    auto data = text_bytes(30000, 4);
    auto blob = DecodeRouter::encodeDictionaryFallback(data, dict, 3);
    EXPECT_TRUE(hasMagic(blob, MAGIC_USZD));
    EXPECT_EQ(router.decode(blob, store, policy), data);
}

TEST(DecodeRouterTest, BrotliFallbackRoundTrip) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    auto data = text_bytes(200000, 5);
    auto blob = DecodeRouter::encodeBrotliFallback(data, 5);
    EXPECT_TRUE(hasMagic(blob, MAGIC_USBR));
    EXPECT_LT(blob.size(), data.size());
    EXPECT_EQ(router.decode(blob, store, policy), data);

    std::vector<std::byte> empty;
    EXPECT_TRUE(router.decode(DecodeRouter::encodeBrotliFallback(empty), store, policy).empty());
    EXPECT_THROW(DecodeRouter::encodeBrotliFallback(data, 12), std::invalid_argument);
}

TEST(DecodeRouterTest, Bzip2FallbackRoundTrip) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    auto data = text_bytes(200000, 6);
    auto blob = DecodeRouter::encodeBzip2Fallback(data);
    EXPECT_TRUE(hasMagic(blob, MAGIC_USBZ));
    EXPECT_LT(blob.size(), data.size());
    EXPECT_EQ(router.decode(blob, store, policy), data);

    auto binary = random_bytes(10000, 7);
    EXPECT_EQ(router.decode(DecodeRouter::encodeBzip2Fallback(binary, 1), store, policy),
              binary);
    std::vector<std::byte> empty;
    EXPECT_TRUE(router.decode(DecodeRouter::encodeBzip2Fallback(empty), store, policy).empty());
    EXPECT_THROW(DecodeRouter::encodeBzip2Fallback(data, 0), std::invalid_argument);
}

TEST(DecodeRouterTest, CognitiveDecoderStillRejectsFallbackMagic) {
    ChunkStore store;
    SecurityPolicy policy;
    Codec codec;
    auto blob = DecodeRouter::encodeBrotliFallback(text_bytes(1000, 8));
    EXPECT_THROW(codec.decode(blob, store, policy), UnrecognizedFormatError);
}

TEST(DecodeRouterTest, UnsupportedAndUnknownFamiliesThrow) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    EXPECT_THROW(router.decode(string_to_byte_vector("TPF3payload"), store, policy),
                 UnsupportedFormatError);
    EXPECT_THROW(router.decode(string_to_byte_vector("JUNKpayload"), store, policy),
                 UnrecognizedFormatError);
}

TEST(DecodeRouterTest, StreamingFallbacksAreBounded) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router(CodecOptions{}, 1024);
    std::vector<std::byte> zeros(1 << 20, std::byte{0});
    EXPECT_THROW(router.decode(DecodeRouter::encodeBrotliFallback(zeros), store, policy),
                 ExpansionLimitExceededError);
    EXPECT_THROW(router.decode(DecodeRouter::encodeBzip2Fallback(zeros), store, policy),
                 ExpansionLimitExceededError);

    std::vector<std::byte> small(1024, std::byte{'a'});
    EXPECT_EQ(router.decode(DecodeRouter::encodeBrotliFallback(small), store, policy), small);
    EXPECT_EQ(router.decode(DecodeRouter::encodeBzip2Fallback(small), store, policy), small);
}

TEST(DecodeRouterTest, DamagedStreamingFallbacks) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    auto data = text_bytes(50000, 9);

    auto brotli = DecodeRouter::encodeBrotliFallback(data);
    brotli.resize(brotli.size() / 2);
    EXPECT_THROW(router.decode(brotli, store, policy), MalformedEnvelopeError);

    auto bzip2 = DecodeRouter::encodeBzip2Fallback(data);
    bzip2.resize(bzip2.size() / 2);
    EXPECT_THROW(router.decode(bzip2, store, policy), MalformedEnvelopeError);

    EXPECT_THROW(router.decode(string_to_byte_vector("USBZnot a bzip2 stream"), store, policy),
                 CorruptChunkError);
    auto trailing = DecodeRouter::encodeBzip2Fallback(data);
    trailing.push_back(std::byte{0x42});
    EXPECT_THROW(router.decode(trailing, store, policy), MalformedEnvelopeError);
}

TEST(DecodeRouterTest, FallbackSizeIsBounded) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router(CodecOptions{}, 1024);
    auto blob = DecodeRouter::encodeRawFallback(std::vector<std::byte>(4096, std::byte{0}));
    EXPECT_THROW(router.decode(blob, store, policy), ExpansionLimitExceededError);
}

TEST(DecodeRouterTest, CorruptFallbackFrame) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    EXPECT_THROW(router.decode(string_to_byte_vector("USZRgarbage-frame"), store, policy),
                 MalformedEnvelopeError);

    ByteWriter w;
    w.putTag(MAGIC_USZD);
    w.putU32(100); // dictionary longer than the blob
    EXPECT_THROW(router.decode(w.bytes(), store, policy), MalformedEnvelopeError);
}

TEST(DecodeRouterTest, TruncatedStreamIsMalformed) {
    ChunkStore store;
    SecurityPolicy policy;
    DecodeRouter router;
    ByteWriter w;
    w.putTag(MAGIC_USST);
    w.putU8(WIRE_VERSION);
    w.putUvarint(50); // segment length with no segment and no terminator
    EXPECT_THROW(router.decode(w.bytes(), store, policy), MalformedEnvelopeError);
}
