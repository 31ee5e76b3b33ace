#include "gtest/gtest.h"
#include "cogdedup/decode_router.hpp"
#include "cogdedup/stream_encoder.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace cogdedup;

TEST(StreamEncoderTest, StreamRoundTripsThroughRouter) {
    ChunkStore store;
    SecurityPolicy policy;
    Predictor predictor;
    StreamEncoder encoder(store, policy, &predictor, CodecOptions{}, 4);

    auto data = text_bytes(200 * 1024, 3);
    for (size_t pos = 0; pos < data.size(); pos += 1000) {
        size_t const n = std::min<size_t>(1000, data.size() - pos);
        encoder.feed(std::span<const std::byte>(data).subspan(pos, n));
    }
    EncodeResult result = encoder.finish();
    EXPECT_TRUE(encoder.finished());
    EXPECT_GT(encoder.segments(), 1u);
    EXPECT_EQ(result.stats.original_size, data.size());
    EXPECT_EQ(result.stats.chunks, encoder.chunks());
    EXPECT_EQ(result.stats.integrity_hash, ChunkIO::hash(data).cid);
    EXPECT_TRUE(hasMagic(result.envelope, MAGIC_USST));

    DecodeRouter router;
    EXPECT_EQ(router.detect(result.envelope), FormatFamily::Stream);
    EXPECT_EQ(router.decode(result.envelope, store, policy), data);
}

TEST(StreamEncoderTest, ChunksMatchOneShotEncoding) {
    ChunkStore stream_store;
    ChunkStore batch_store;
    SecurityPolicy policy;
    auto data = random_bytes(100 * 1024, 8);

    StreamEncoder encoder(stream_store, policy);
    encoder.feed(data);
    EncodeResult streamed = encoder.finish();

    Codec codec;
    EncodeResult batch = codec.encode(data, batch_store, policy);
    EXPECT_EQ(streamed.stats.chunks, batch.stats.chunks);
    auto a = stream_store.cids();
    auto b = batch_store.cids();
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    EXPECT_EQ(a, b);
}

TEST(StreamEncoderTest, EmptyStream) {
    ChunkStore store;
    SecurityPolicy policy;
    StreamEncoder encoder(store, policy);
    EncodeResult result = encoder.finish();
    EXPECT_EQ(result.stats.chunks, 0u);
    EXPECT_EQ(encoder.segments(), 0u);
    DecodeRouter router;
    EXPECT_TRUE(router.decode(result.envelope, store, policy).empty());
}

TEST(StreamEncoderTest, RepeatedStreamDeduplicates) {
    ChunkStore store;
    SecurityPolicy policy;
    auto data = random_bytes(64 * 1024, 9);
    {
        StreamEncoder first(store, policy);
        first.feed(data);
        first.finish();
    }
    StreamEncoder second(store, policy);
    second.feed(data);
    EncodeResult result = second.finish();
    EXPECT_EQ(result.stats.ref, result.stats.chunks);
    EXPECT_LT(result.stats.compressed_size, data.size() / 10);
}

TEST(StreamEncoderTest, UseAfterFinishThrows) {
    ChunkStore store;
    SecurityPolicy policy;
    StreamEncoder encoder(store, policy);
    encoder.feed(string_to_byte_vector("abc"));
    encoder.finish();
    EXPECT_THROW(encoder.feed(string_to_byte_vector("more")), std::logic_error);
    EXPECT_THROW(encoder.finish(), std::logic_error);
    EXPECT_THROW(encoder.flushSegment(), std::logic_error);
}
